// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Toolgate a resilient tool-serving process.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "common/Error.hpp"
#include "config/Config.hpp"
#include "ratelimit/RateLimitConfig.hpp"
#include "resilience/RetryPolicy.hpp"

using toolgate::Config;
using toolgate::ErrorCode;
using toolgate::RetryPolicy;
using nlohmann::json;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {
    toolgate::Getenv fakeEnv(std::map<std::string, std::string> vars) {
        return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
            auto it = vars.find(name);
            if (it == vars.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }

    class ConfigFileTest : public ::testing::Test {
    protected:
        void TearDown() override {
            std::remove(path.c_str());
        }
        void write(const std::string& content) {
            std::ofstream out {path};
            out << content;
        }
        std::string path {"toolgate_config_test.json"};
    };
} // namespace

TEST(ConfigTest, DefaultsAreValid) {
    const auto config = Config::defaults();
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_EQ(config.server.transport, "stdio");
    EXPECT_EQ(config.tools.size(), 3U);
    EXPECT_EQ(config.toolTimeout("go-doc"), seconds {30});
    EXPECT_EQ(config.toolTimeout("code-review"), seconds {60});
    EXPECT_EQ(config.toolTimeout("test-gen"), seconds {45});
    EXPECT_EQ(config.toolTimeout("unknown"), seconds {30});
}

TEST(ConfigTest, RateLimitConfigCarriesToolOverrides) {
    const auto rl = Config::defaults().rateLimitConfig();
    EXPECT_TRUE(rl.enabled);
    EXPECT_EQ(rl.limit, 100);
    EXPECT_EQ(rl.mode, toolgate::RateLimitMode::PerTool);
    EXPECT_EQ(rl.keyPrefix, "toolgate");
    EXPECT_EQ(rl.tools.at("go-doc").limit, 50);
    EXPECT_EQ(rl.tools.at("code-review").limit, 30);
}

TEST(ConfigTest, RateLimitConfigRejectsUnknownNames) {
    auto config = Config::defaults();
    config.rateLimit.mode = "per-user";
    EXPECT_THROW(static_cast<void>(config.rateLimitConfig()), std::invalid_argument);
    auto r = config.validate();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(r.error().what.rfind("invalid configuration: invalid mode: per-user", 0), 0U);
}

TEST(ConfigTest, CircuitBreakerConfigPerTool) {
    auto config = Config::defaults();
    config.tools["go-doc"].maxFailures = 9;
    const auto cb = config.circuitBreakerConfig("go-doc");
    EXPECT_EQ(cb.name, "go-doc");
    EXPECT_EQ(cb.maxFailures, 9);
    const auto fallback = config.circuitBreakerConfig("custom-tool");
    EXPECT_EQ(fallback.name, "custom-tool");
    EXPECT_EQ(fallback.maxFailures, 5);
}

TEST(ConfigTest, RetryPolicyOverridesAndDisables) {
    auto config = Config::defaults();
    const auto goDoc = config.retryPolicy("go-doc");
    ASSERT_TRUE(goDoc.has_value());
    EXPECT_EQ(goDoc->maxAttempts, 3);
    EXPECT_EQ(goDoc->maxDelay, seconds {15});
    EXPECT_DOUBLE_EQ(goDoc->multiplier, 2.0);
    EXPECT_TRUE(goDoc->jitter);

    const auto other = config.retryPolicy("custom-tool");
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->maxDelay, seconds {30});

    config.retry.tools["go-doc"].enabled = false;
    EXPECT_FALSE(config.retryPolicy("go-doc").has_value());
    EXPECT_TRUE(config.retryPolicy("test-gen").has_value());

    config.retry.enabled = false;
    EXPECT_FALSE(config.retryPolicy("test-gen").has_value());
}

TEST(ConfigTest, ValidateRejectsBadValues) {
    auto transport = Config::defaults();
    transport.server.transport = "http";
    EXPECT_EQ(transport.validate().error().what, "invalid transport: http (must be stdio or grpc)");

    auto level = Config::defaults();
    level.logging.level = "chatty";
    EXPECT_EQ(level.validate().error().what, "invalid log level: chatty");

    auto timeout = Config::defaults();
    timeout.tools["go-doc"].timeout = seconds {0};
    EXPECT_FALSE(timeout.validate().has_value());

    auto breaker = Config::defaults();
    breaker.tools["go-doc"].maxHalfOpenRequests = 0;
    EXPECT_FALSE(breaker.validate().has_value());

    auto retry = Config::defaults();
    retry.retry.tools["go-doc"].strategy = "fibonacci";
    EXPECT_FALSE(retry.validate().has_value());

    auto attempts = Config::defaults();
    attempts.retry.maxAttempts = 0;
    EXPECT_FALSE(attempts.validate().has_value());
}

TEST(ConfigTest, ApplyJsonOverridesNestedSettings) {
    auto config = Config::defaults();
    const auto j = json::parse(R"({
        "server": {"transport": "grpc", "listen_address": "0.0.0.0:6000"},
        "logging": {"level": "debug", "async": false},
        "timeouts": {"default": "10s", "shutdown": 2000},
        "doc_lookup": {"go_binary": "/usr/local/go/bin/go"},
        "tools": {
            "go-doc": {"timeout": "5s", "circuit_breaker": {"max_failures": 2}},
            "lint": {"circuit_breaker": {"timeout": "1m"}}
        },
        "rate_limit": {"limit": 10, "window": "30s", "tools": {"go-doc": {"limit": 3}}},
        "retry": {"strategy": "linear", "tools": {"go-doc": {"enabled": false}}}
    })");
    ASSERT_TRUE(toolgate::applyJson(config, j).has_value());
    EXPECT_EQ(config.server.transport, "grpc");
    EXPECT_EQ(config.server.listenAddress, "0.0.0.0:6000");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_FALSE(config.logging.async);
    EXPECT_EQ(config.timeouts.defaultTimeout, seconds {10});
    EXPECT_EQ(config.timeouts.shutdown, milliseconds {2000});
    EXPECT_EQ(config.docLookup.goBinary, "/usr/local/go/bin/go");
    EXPECT_EQ(config.tools["go-doc"].timeout, seconds {5});
    EXPECT_EQ(config.tools["go-doc"].maxFailures, 2);
    EXPECT_EQ(config.tools["go-doc"].maxHalfOpenRequests, 3);
    EXPECT_EQ(config.tools["lint"].timeout, seconds {10});
    EXPECT_EQ(config.tools["lint"].openTimeout, std::chrono::minutes {1});
    EXPECT_EQ(config.rateLimit.limit, 10);
    EXPECT_EQ(config.rateLimit.window, seconds {30});
    EXPECT_EQ(config.rateLimit.tools["go-doc"].limit, 3);
    EXPECT_EQ(config.retry.strategy, "linear");
    EXPECT_FALSE(config.retryPolicy("go-doc").has_value());
    EXPECT_EQ(config.retryPolicy("lint")->strategy, RetryPolicy::Strategy::Linear);
    EXPECT_TRUE(config.validate().has_value());
}

TEST(ConfigTest, ApplyJsonReportsTypeErrors) {
    auto config = Config::defaults();
    auto r = toolgate::applyJson(config, json::parse(R"({"rate_limit": {"limit": "many"}})"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArg);

    auto d = toolgate::applyJson(config, json::parse(R"({"timeouts": {"default": "soon"}})"));
    ASSERT_FALSE(d.has_value());
    EXPECT_NE(d.error().what.find("default"), std::string::npos);
}

TEST(ConfigTest, EnvironmentOverrides) {
    auto config = Config::defaults();
    auto r = toolgate::applyEnvironment(config, fakeEnv({
        {"TOOLGATE_TRANSPORT", "grpc"},
        {"TOOLGATE_LOG_LEVEL", "warn"},
        {"TOOLGATE_GO_DOC_TIMEOUT", "12s"},
        {"TOOLGATE_GO_DOC_CB_MAX_FAILURES", "7"},
        {"TOOLGATE_TEST_GEN_CB_MAX_HALF_OPEN", "1"},
        {"TOOLGATE_RATELIMIT_ENABLED", "off"},
        {"TOOLGATE_RATELIMIT_MODE", "global"},
        {"TOOLGATE_RETRY_MULTIPLIER", "1.5"},
        {"TOOLGATE_RETRY_JITTER", "false"},
        {"TOOLGATE_RETRY_MAX_DELAY", "250ms"},
    }));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(config.server.transport, "grpc");
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_EQ(config.tools["go-doc"].timeout, seconds {12});
    EXPECT_EQ(config.tools["go-doc"].maxFailures, 7);
    EXPECT_EQ(config.tools["test-gen"].maxHalfOpenRequests, 1);
    EXPECT_FALSE(config.rateLimit.enabled);
    EXPECT_EQ(config.rateLimit.mode, "global");
    EXPECT_DOUBLE_EQ(config.retry.multiplier, 1.5);
    EXPECT_FALSE(config.retry.jitter);
    EXPECT_EQ(config.retry.maxDelay, milliseconds {250});
}

TEST(ConfigTest, EnvironmentRejectsMalformedValues) {
    auto config = Config::defaults();
    auto b = toolgate::applyEnvironment(config, fakeEnv({{"TOOLGATE_RETRY_ENABLED", "maybe"}}));
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().what, "TOOLGATE_RETRY_ENABLED: invalid boolean: maybe");

    auto n = toolgate::applyEnvironment(config, fakeEnv({{"TOOLGATE_RATELIMIT_LIMIT", "10x"}}));
    ASSERT_FALSE(n.has_value());
    EXPECT_EQ(n.error().what, "TOOLGATE_RATELIMIT_LIMIT: invalid number: 10x");

    auto d = toolgate::applyEnvironment(config, fakeEnv({{"TOOLGATE_TIMEOUT_DEFAULT", "fast"}}));
    ASSERT_FALSE(d.has_value());
    EXPECT_EQ(d.error().code, ErrorCode::InvalidArg);
}

TEST(ConfigTest, LoadWithoutFileUsesDefaultsAndEnvironment) {
    auto config = toolgate::loadConfig("", fakeEnv({{"TOOLGATE_RATELIMIT_LIMIT", "42"}}));
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->rateLimit.limit, 42);
}

TEST(ConfigTest, LoadReportsMissingFile) {
    auto config = toolgate::loadConfig("/nonexistent/toolgate.json", fakeEnv({}));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::NotFound);
    EXPECT_EQ(config.error().what, "cannot open config file: /nonexistent/toolgate.json");
}

TEST(ConfigTest, LoadValidatesMergedResult) {
    auto config = toolgate::loadConfig("", fakeEnv({{"TOOLGATE_TRANSPORT", "carrier-pigeon"}}));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArg);
}

TEST_F(ConfigFileTest, EnvironmentWinsOverFile) {
    write(R"({"rate_limit": {"limit": 10}, "logging": {"level": "debug"}})");
    auto config = toolgate::loadConfig(path, fakeEnv({{"TOOLGATE_RATELIMIT_LIMIT", "20"}}));
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->rateLimit.limit, 20);
    EXPECT_EQ(config->logging.level, "debug");
}

TEST_F(ConfigFileTest, MalformedFileIsInvalid) {
    write("{ not json");
    auto config = toolgate::loadConfig(path, fakeEnv({}));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArg);
}

TEST_F(ConfigFileTest, PrintedConfigLoadsBack) {
    auto original = Config::defaults();
    original.rateLimit.limit = 77;
    original.tools["go-doc"].openTimeout = milliseconds {1500};
    write(toolgate::toJson(original).dump(2));
    auto loaded = toolgate::loadConfig(path, fakeEnv({}));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->rateLimit.limit, 77);
    EXPECT_EQ(loaded->tools["go-doc"].openTimeout, milliseconds {1500});
    EXPECT_EQ(toolgate::toJson(loaded.value()), toolgate::toJson(original));
}
