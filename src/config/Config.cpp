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
#include "config/Config.hpp"
#include "common/Error.hpp"
#include "common/Logging.hpp"
#include "common/Util.hpp"
#include "ratelimit/RateLimitConfig.hpp"
#include "resilience/CircuitBreaker.hpp"
#include "resilience/RetryPolicy.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

namespace toolgate {

namespace {

using json = nlohmann::json;

template<typename T>
void read(const json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

void readDuration(const json& j, const char* key, std::chrono::microseconds& out) {
    if (!j.contains(key)) {
        return;
    }
    const auto& v = j.at(key);
    if (v.is_number_integer()) {
        out = std::chrono::milliseconds {v.get<int64_t>()};
        return;
    }
    auto d = parseDuration(v.get<std::string>());
    if (!d.has_value()) {
        throw std::invalid_argument(std::string {key} + ": " + d.error().what);
    }
    out = d.value();
}

std::expected<bool, Error> parseBool(const std::string& v) {
    std::string l {v};
    std::transform(l.begin(), l.end(), l.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (l == "true" || l == "1" || l == "yes" || l == "on") {
        return true;
    }
    if (l == "false" || l == "0" || l == "no" || l == "off") {
        return false;
    }
    return std::unexpected {Error {ErrorCode::InvalidArg, "invalid boolean: " + v}};
}

template<typename T>
std::expected<T, Error> parseNumber(const std::string& v) {
    T out {};
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc {} || ptr != v.data() + v.size()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "invalid number: " + v}};
    }
    return out;
}

// "go-doc" -> "GO_DOC"
std::string envName(const std::string& tool) {
    std::string out;
    for (const unsigned char c : tool) {
        out.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_');
    }
    return out;
}

ToolSettings newTool(const Config& config) {
    ToolSettings t {};
    t.timeout = config.timeouts.defaultTimeout;
    return t;
}

} // namespace

Config Config::defaults() {
    Config c {};
    c.tools["go-doc"] = ToolSettings {std::chrono::seconds {30}, 5, std::chrono::seconds {30}, 3};
    c.tools["code-review"] = ToolSettings {std::chrono::seconds {60}, 5, std::chrono::seconds {30}, 3};
    c.tools["test-gen"] = ToolSettings {std::chrono::seconds {45}, 5, std::chrono::seconds {30}, 3};
    c.rateLimit.tools["go-doc"] = ToolRateLimitSettings {true, 50, std::chrono::minutes {1}};
    c.rateLimit.tools["code-review"] = ToolRateLimitSettings {true, 30, std::chrono::minutes {1}};
    c.rateLimit.tools["test-gen"] = ToolRateLimitSettings {true, 30, std::chrono::minutes {1}};
    c.retry.tools["go-doc"] = ToolRetrySettings {true, 3, std::chrono::seconds {1}, std::chrono::seconds {15}, "exponential"};
    c.retry.tools["code-review"] = ToolRetrySettings {true, 2, std::chrono::milliseconds {500}, std::chrono::seconds {10}, "exponential"};
    c.retry.tools["test-gen"] = ToolRetrySettings {true, 2, std::chrono::milliseconds {500}, std::chrono::seconds {10}, "exponential"};
    return c;
}

RateLimitConfig Config::rateLimitConfig() const {
    auto mode = parseRateLimitMode(rateLimit.mode);
    if (!mode.has_value()) {
        throw std::invalid_argument(mode.error().what);
    }
    auto algorithm = parseRateLimitAlgorithm(rateLimit.algorithm);
    if (!algorithm.has_value()) {
        throw std::invalid_argument(algorithm.error().what);
    }
    auto store = parseStoreType(rateLimit.storeType);
    if (!store.has_value()) {
        throw std::invalid_argument(store.error().what);
    }
    RateLimitConfig rl {
        rateLimit.enabled,
        rateLimit.limit,
        std::chrono::duration_cast<std::chrono::milliseconds>(rateLimit.window),
        mode.value(),
        algorithm.value(),
        store.value(),
        rateLimit.keyPrefix
    };
    for (const auto& [tool, t] : rateLimit.tools) {
        rl.tools.insert_or_assign(tool, ToolRateLimit {t.enabled, t.limit, std::chrono::duration_cast<std::chrono::milliseconds>(t.window)});
    }
    return rl;
}

CircuitBreakerConfig Config::circuitBreakerConfig(const std::string& tool) const {
    auto it = tools.find(tool);
    if (it == tools.end()) {
        return CircuitBreakerConfig::defaults(tool);
    }
    return CircuitBreakerConfig {tool, it->second.maxFailures, it->second.openTimeout, it->second.maxHalfOpenRequests};
}

std::optional<RetryPolicy> Config::retryPolicy(const std::string& tool) const {
    if (!retry.enabled) {
        return std::nullopt;
    }
    if (auto it = retry.tools.find(tool); it != retry.tools.end()) {
        if (!it->second.enabled) {
            return std::nullopt;
        }
        auto strategy = parseStrategy(it->second.strategy);
        if (!strategy.has_value()) {
            throw std::invalid_argument(strategy.error().what);
        }
        return RetryPolicy {it->second.maxAttempts, it->second.initialDelay, it->second.maxDelay, 2.0, true, strategy.value()};
    }
    auto strategy = parseStrategy(retry.strategy);
    if (!strategy.has_value()) {
        throw std::invalid_argument(strategy.error().what);
    }
    return RetryPolicy {retry.maxAttempts, retry.initialDelay, retry.maxDelay, retry.multiplier, retry.jitter, strategy.value()};
}

std::chrono::microseconds Config::toolTimeout(const std::string& tool) const {
    if (auto it = tools.find(tool); it != tools.end()) {
        return it->second.timeout;
    }
    return timeouts.defaultTimeout;
}

std::expected<std::monostate, Error> Config::validate() const {
    if (server.transport != "stdio" && server.transport != "grpc") {
        return std::unexpected {Error {ErrorCode::InvalidArg, "invalid transport: " + server.transport + " (must be stdio or grpc)"}};
    }
    if (auto level = parseLogLevel(logging.level); !level.has_value()) {
        return std::unexpected {level.error()};
    }
    if (timeouts.defaultTimeout <= std::chrono::microseconds::zero()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "timeouts.default must be positive"}};
    }
    if (timeouts.shutdown <= std::chrono::microseconds::zero()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "timeouts.shutdown must be positive"}};
    }
    try {
        std::ignore = rateLimitConfig();
        std::ignore = retryPolicy("");
        for (const auto& [tool, t] : tools) {
            if (t.timeout <= std::chrono::microseconds::zero()) {
                throw std::invalid_argument("timeout must be positive");
            }
            std::ignore = circuitBreakerConfig(tool);
            std::ignore = retryPolicy(tool);
        }
        for (const auto& entry : retry.tools) {
            std::ignore = retryPolicy(entry.first);
        }
    } catch (const std::invalid_argument& e) {
        return std::unexpected {Error {ErrorCode::InvalidArg, std::string {"invalid configuration: "} + e.what()}};
    }
    return {};
}

std::expected<std::monostate, Error> applyJson(Config& config, const nlohmann::json& j) {
    try {
        if (j.contains("server")) {
            const auto& s = j.at("server");
            read(s, "name", config.server.name);
            read(s, "version", config.server.version);
            read(s, "transport", config.server.transport);
            read(s, "listen_address", config.server.listenAddress);
        }
        if (j.contains("logging")) {
            const auto& l = j.at("logging");
            read(l, "level", config.logging.level);
            read(l, "file", config.logging.file);
            read(l, "max_file_size", config.logging.maxFileSize);
            read(l, "max_files", config.logging.maxFiles);
            read(l, "async", config.logging.async);
        }
        if (j.contains("timeouts")) {
            const auto& t = j.at("timeouts");
            readDuration(t, "default", config.timeouts.defaultTimeout);
            readDuration(t, "shutdown", config.timeouts.shutdown);
        }
        if (j.contains("doc_lookup")) {
            const auto& d = j.at("doc_lookup");
            read(d, "go_binary", config.docLookup.goBinary);
            read(d, "working_dir", config.docLookup.workingDir);
        }
        if (j.contains("tools")) {
            for (const auto& [name, t] : j.at("tools").items()) {
                auto [it, inserted] = config.tools.try_emplace(name, newTool(config));
                readDuration(t, "timeout", it->second.timeout);
                if (t.contains("circuit_breaker")) {
                    const auto& cb = t.at("circuit_breaker");
                    read(cb, "max_failures", it->second.maxFailures);
                    readDuration(cb, "timeout", it->second.openTimeout);
                    read(cb, "max_half_open_requests", it->second.maxHalfOpenRequests);
                }
            }
        }
        if (j.contains("rate_limit")) {
            const auto& r = j.at("rate_limit");
            read(r, "enabled", config.rateLimit.enabled);
            read(r, "limit", config.rateLimit.limit);
            readDuration(r, "window", config.rateLimit.window);
            read(r, "mode", config.rateLimit.mode);
            read(r, "algorithm", config.rateLimit.algorithm);
            read(r, "store_type", config.rateLimit.storeType);
            read(r, "key_prefix", config.rateLimit.keyPrefix);
            if (r.contains("tools")) {
                for (const auto& [name, t] : r.at("tools").items()) {
                    auto& tool = config.rateLimit.tools[name];
                    read(t, "enabled", tool.enabled);
                    read(t, "limit", tool.limit);
                    readDuration(t, "window", tool.window);
                }
            }
        }
        if (j.contains("retry")) {
            const auto& r = j.at("retry");
            read(r, "enabled", config.retry.enabled);
            read(r, "max_attempts", config.retry.maxAttempts);
            readDuration(r, "initial_delay", config.retry.initialDelay);
            readDuration(r, "max_delay", config.retry.maxDelay);
            read(r, "multiplier", config.retry.multiplier);
            read(r, "jitter", config.retry.jitter);
            read(r, "strategy", config.retry.strategy);
            if (r.contains("tools")) {
                for (const auto& [name, t] : r.at("tools").items()) {
                    auto& tool = config.retry.tools[name];
                    read(t, "enabled", tool.enabled);
                    read(t, "max_attempts", tool.maxAttempts);
                    readDuration(t, "initial_delay", tool.initialDelay);
                    readDuration(t, "max_delay", tool.maxDelay);
                    read(t, "strategy", tool.strategy);
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected {Error {ErrorCode::InvalidArg, std::string {"invalid configuration: "} + e.what()}};
    } catch (const std::invalid_argument& e) {
        return std::unexpected {Error {ErrorCode::InvalidArg, std::string {"invalid configuration: "} + e.what()}};
    }
    return {};
}

std::expected<std::monostate, Error> applyEnvironment(Config& config, const Getenv& getenv) {
    std::optional<Error> failure;
    auto str = [&getenv](const std::string& name, std::string& out) {
        if (auto v = getenv(name); v.has_value()) {
            out = v.value();
        }
    };
    auto boolean = [&getenv, &failure](const std::string& name, bool& out) {
        if (auto v = getenv(name); v.has_value()) {
            auto b = parseBool(v.value());
            if (b.has_value()) {
                out = b.value();
            } else {
                failure = Error {ErrorCode::InvalidArg, name + ": " + b.error().what};
            }
        }
    };
    auto integer = [&getenv, &failure](const std::string& name, int& out) {
        if (auto v = getenv(name); v.has_value()) {
            auto n = parseNumber<int>(v.value());
            if (n.has_value()) {
                out = n.value();
            } else {
                failure = Error {ErrorCode::InvalidArg, name + ": " + n.error().what};
            }
        }
    };
    auto real = [&getenv, &failure](const std::string& name, double& out) {
        if (auto v = getenv(name); v.has_value()) {
            auto n = parseNumber<double>(v.value());
            if (n.has_value()) {
                out = n.value();
            } else {
                failure = Error {ErrorCode::InvalidArg, name + ": " + n.error().what};
            }
        }
    };
    auto duration = [&getenv, &failure](const std::string& name, std::chrono::microseconds& out) {
        if (auto v = getenv(name); v.has_value()) {
            auto d = parseDuration(v.value());
            if (d.has_value()) {
                out = d.value();
            } else {
                failure = Error {ErrorCode::InvalidArg, name + ": " + d.error().what};
            }
        }
    };

    str("TOOLGATE_TRANSPORT", config.server.transport);
    str("TOOLGATE_LISTEN_ADDRESS", config.server.listenAddress);
    str("TOOLGATE_LOG_LEVEL", config.logging.level);
    str("TOOLGATE_LOG_FILE", config.logging.file);
    duration("TOOLGATE_TIMEOUT_DEFAULT", config.timeouts.defaultTimeout);
    duration("TOOLGATE_TIMEOUT_SHUTDOWN", config.timeouts.shutdown);
    str("TOOLGATE_GO_BINARY", config.docLookup.goBinary);
    str("TOOLGATE_GO_WORKING_DIR", config.docLookup.workingDir);

    for (auto& [tool, t] : config.tools) {
        const auto prefix = "TOOLGATE_" + envName(tool);
        duration(prefix + "_TIMEOUT", t.timeout);
        integer(prefix + "_CB_MAX_FAILURES", t.maxFailures);
        duration(prefix + "_CB_TIMEOUT", t.openTimeout);
        integer(prefix + "_CB_MAX_HALF_OPEN", t.maxHalfOpenRequests);
    }

    boolean("TOOLGATE_RATELIMIT_ENABLED", config.rateLimit.enabled);
    integer("TOOLGATE_RATELIMIT_LIMIT", config.rateLimit.limit);
    duration("TOOLGATE_RATELIMIT_WINDOW", config.rateLimit.window);
    str("TOOLGATE_RATELIMIT_MODE", config.rateLimit.mode);
    str("TOOLGATE_RATELIMIT_ALGORITHM", config.rateLimit.algorithm);
    str("TOOLGATE_RATELIMIT_STORE_TYPE", config.rateLimit.storeType);
    str("TOOLGATE_RATELIMIT_KEY_PREFIX", config.rateLimit.keyPrefix);

    boolean("TOOLGATE_RETRY_ENABLED", config.retry.enabled);
    integer("TOOLGATE_RETRY_MAX_ATTEMPTS", config.retry.maxAttempts);
    duration("TOOLGATE_RETRY_INITIAL_DELAY", config.retry.initialDelay);
    duration("TOOLGATE_RETRY_MAX_DELAY", config.retry.maxDelay);
    real("TOOLGATE_RETRY_MULTIPLIER", config.retry.multiplier);
    boolean("TOOLGATE_RETRY_JITTER", config.retry.jitter);
    str("TOOLGATE_RETRY_STRATEGY", config.retry.strategy);

    if (failure.has_value()) {
        return std::unexpected {failure.value()};
    }
    return {};
}

std::optional<std::string> systemGetenv(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (v == nullptr) {
        return std::nullopt;
    }
    return std::string {v};
}

std::expected<Config, Error> loadConfig(const std::string& path, const Getenv& getenv) {
    auto config = Config::defaults();
    if (!path.empty()) {
        std::ifstream in {path};
        if (!in) {
            return std::unexpected {Error {ErrorCode::NotFound, "cannot open config file: " + path}};
        }
        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::parse_error& e) {
            return std::unexpected {Error {ErrorCode::InvalidArg, "cannot parse config file " + path + ": " + e.what()}};
        }
        if (auto r = applyJson(config, j); !r.has_value()) {
            return std::unexpected {r.error()};
        }
        spdlog::debug("Loaded configuration from {}", path);
    }
    if (auto r = applyEnvironment(config, getenv); !r.has_value()) {
        return std::unexpected {r.error()};
    }
    if (auto r = config.validate(); !r.has_value()) {
        return std::unexpected {r.error()};
    }
    return config;
}

nlohmann::json toJson(const Config& config) {
    json j;
    j["server"] = {
        {"name", config.server.name},
        {"version", config.server.version},
        {"transport", config.server.transport},
        {"listen_address", config.server.listenAddress}
    };
    j["logging"] = {
        {"level", config.logging.level},
        {"file", config.logging.file},
        {"max_file_size", config.logging.maxFileSize},
        {"max_files", config.logging.maxFiles},
        {"async", config.logging.async}
    };
    j["timeouts"] = {
        {"default", formatDuration(config.timeouts.defaultTimeout)},
        {"shutdown", formatDuration(config.timeouts.shutdown)}
    };
    j["doc_lookup"] = {
        {"go_binary", config.docLookup.goBinary},
        {"working_dir", config.docLookup.workingDir}
    };
    j["tools"] = json::object();
    for (const auto& [name, t] : config.tools) {
        j["tools"][name] = {
            {"timeout", formatDuration(t.timeout)},
            {"circuit_breaker", {
                {"max_failures", t.maxFailures},
                {"timeout", formatDuration(t.openTimeout)},
                {"max_half_open_requests", t.maxHalfOpenRequests}
            }}
        };
    }
    j["rate_limit"] = {
        {"enabled", config.rateLimit.enabled},
        {"limit", config.rateLimit.limit},
        {"window", formatDuration(config.rateLimit.window)},
        {"mode", config.rateLimit.mode},
        {"algorithm", config.rateLimit.algorithm},
        {"store_type", config.rateLimit.storeType},
        {"key_prefix", config.rateLimit.keyPrefix},
        {"tools", json::object()}
    };
    for (const auto& [name, t] : config.rateLimit.tools) {
        j["rate_limit"]["tools"][name] = {
            {"enabled", t.enabled},
            {"limit", t.limit},
            {"window", formatDuration(t.window)}
        };
    }
    j["retry"] = {
        {"enabled", config.retry.enabled},
        {"max_attempts", config.retry.maxAttempts},
        {"initial_delay", formatDuration(config.retry.initialDelay)},
        {"max_delay", formatDuration(config.retry.maxDelay)},
        {"multiplier", config.retry.multiplier},
        {"jitter", config.retry.jitter},
        {"strategy", config.retry.strategy},
        {"tools", json::object()}
    };
    for (const auto& [name, t] : config.retry.tools) {
        j["retry"]["tools"][name] = {
            {"enabled", t.enabled},
            {"max_attempts", t.maxAttempts},
            {"initial_delay", formatDuration(t.initialDelay)},
            {"max_delay", formatDuration(t.maxDelay)},
            {"strategy", t.strategy}
        };
    }
    return j;
}

} // namespace toolgate
