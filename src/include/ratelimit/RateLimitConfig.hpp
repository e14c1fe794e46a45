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
#ifndef TOOLGATE_RATE_LIMIT_CONFIG_H
#define TOOLGATE_RATE_LIMIT_CONFIG_H

#include <chrono>
#include <expected>
#include <string>
#include <unordered_map>
#include "common/Error.hpp"

namespace toolgate {

enum class RateLimitMode : char {
    PerTool,
    Global,
    IpBased,
    Custom
};

// Reported only; counting is always a fixed window.
enum class RateLimitAlgorithm : char {
    TokenBucket,
    SlidingWindow
};

enum class StoreType : char {
    Memory,
    NoOp
};

std::expected<RateLimitMode, Error> parseRateLimitMode(const std::string& s);
std::expected<RateLimitAlgorithm, Error> parseRateLimitAlgorithm(const std::string& s);
std::expected<StoreType, Error> parseStoreType(const std::string& s);
std::string toString(const RateLimitMode& mode);
std::string toString(const RateLimitAlgorithm& algorithm);
std::string toString(const StoreType& store);

struct ToolRateLimit {
    // Limits are only validated when enabled.
    ToolRateLimit(bool e, int l, std::chrono::milliseconds w);
    // 50 requests per minute.
    static ToolRateLimit defaults(bool enabled);

    bool enabled;
    int limit;
    std::chrono::milliseconds window;
};

struct RateLimitConfig {
    RateLimitConfig(
        bool e,
        int l,
        std::chrono::milliseconds w,
        RateLimitMode m,
        RateLimitAlgorithm a,
        StoreType s,
        std::string prefix
    );
    // Enabled, 100 requests per minute, per-tool, memory store, prefix "toolgate".
    static RateLimitConfig defaults();

    bool enabled;
    int limit;
    std::chrono::milliseconds window;
    RateLimitMode mode;
    RateLimitAlgorithm algorithm;
    StoreType storeType;
    std::string keyPrefix;
    std::unordered_map<std::string, ToolRateLimit> tools;
};

} // namespace toolgate

#endif // TOOLGATE_RATE_LIMIT_CONFIG_H
