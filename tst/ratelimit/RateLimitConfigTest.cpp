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
#include <stdexcept>
#include "common/Error.hpp"
#include "ratelimit/RateLimitConfig.hpp"

using toolgate::RateLimitAlgorithm;
using toolgate::RateLimitConfig;
using toolgate::RateLimitMode;
using toolgate::StoreType;
using toolgate::ToolRateLimit;

TEST(RateLimitConfigTest, Defaults) {
    const auto cfg = RateLimitConfig::defaults();
    EXPECT_TRUE(cfg.enabled);
    EXPECT_EQ(cfg.limit, 100);
    EXPECT_EQ(cfg.window, std::chrono::minutes {1});
    EXPECT_EQ(cfg.mode, RateLimitMode::PerTool);
    EXPECT_EQ(cfg.storeType, StoreType::Memory);
    EXPECT_EQ(cfg.keyPrefix, "toolgate");
    EXPECT_TRUE(cfg.tools.empty());
}

TEST(RateLimitConfigTest, ValidatesOnlyWhenEnabled) {
    using std::chrono::milliseconds;
    EXPECT_THROW(RateLimitConfig(true, 0, milliseconds {1000}, RateLimitMode::Global,
        RateLimitAlgorithm::TokenBucket, StoreType::Memory, "p"), std::invalid_argument);
    EXPECT_THROW(RateLimitConfig(true, 10, milliseconds {0}, RateLimitMode::Global,
        RateLimitAlgorithm::TokenBucket, StoreType::Memory, "p"), std::invalid_argument);
    EXPECT_NO_THROW(RateLimitConfig(false, 0, milliseconds {0}, RateLimitMode::Global,
        RateLimitAlgorithm::TokenBucket, StoreType::Memory, "p"));
    EXPECT_THROW(ToolRateLimit(true, -1, milliseconds {1000}), std::invalid_argument);
    EXPECT_NO_THROW(ToolRateLimit(false, -1, milliseconds {0}));
}

TEST(RateLimitConfigTest, ToolDefaults) {
    const auto t = ToolRateLimit::defaults(true);
    EXPECT_TRUE(t.enabled);
    EXPECT_EQ(t.limit, 50);
    EXPECT_EQ(t.window, std::chrono::minutes {1});
}

TEST(RateLimitConfigTest, ParsesNames) {
    EXPECT_EQ(toolgate::parseRateLimitMode("per-tool").value(), RateLimitMode::PerTool);
    EXPECT_EQ(toolgate::parseRateLimitMode("global").value(), RateLimitMode::Global);
    EXPECT_EQ(toolgate::parseRateLimitMode("ip-based").value(), RateLimitMode::IpBased);
    EXPECT_EQ(toolgate::parseRateLimitMode("custom").value(), RateLimitMode::Custom);
    EXPECT_EQ(toolgate::parseRateLimitMode("per-user").error().code, toolgate::ErrorCode::InvalidArg);
    EXPECT_EQ(toolgate::parseRateLimitAlgorithm("sliding-window").value(), RateLimitAlgorithm::SlidingWindow);
    EXPECT_FALSE(toolgate::parseRateLimitAlgorithm("leaky-bucket").has_value());
    EXPECT_EQ(toolgate::parseStoreType("noop").value(), StoreType::NoOp);
    EXPECT_FALSE(toolgate::parseStoreType("redis").has_value());
}

TEST(RateLimitConfigTest, NamesRoundTrip) {
    for (const auto mode : {RateLimitMode::PerTool, RateLimitMode::Global, RateLimitMode::IpBased, RateLimitMode::Custom}) {
        EXPECT_EQ(toolgate::parseRateLimitMode(toolgate::toString(mode)).value(), mode);
    }
    EXPECT_EQ(toolgate::toString(RateLimitAlgorithm::TokenBucket), "token-bucket");
    EXPECT_EQ(toolgate::toString(StoreType::Memory), "memory");
}
