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
#include "ratelimit/RateLimitConfig.hpp"
#include "common/Error.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace toolgate {

std::expected<RateLimitMode, Error> parseRateLimitMode(const std::string& s) {
    if (s == "per-tool") return RateLimitMode::PerTool;
    if (s == "global") return RateLimitMode::Global;
    if (s == "ip-based") return RateLimitMode::IpBased;
    if (s == "custom") return RateLimitMode::Custom;
    return std::unexpected {Error {ErrorCode::InvalidArg,
        "invalid mode: " + s + " (must be per-tool, global, ip-based, or custom)"}};
}

std::expected<RateLimitAlgorithm, Error> parseRateLimitAlgorithm(const std::string& s) {
    if (s == "token-bucket") return RateLimitAlgorithm::TokenBucket;
    if (s == "sliding-window") return RateLimitAlgorithm::SlidingWindow;
    return std::unexpected {Error {ErrorCode::InvalidArg,
        "invalid algorithm: " + s + " (must be token-bucket or sliding-window)"}};
}

std::expected<StoreType, Error> parseStoreType(const std::string& s) {
    if (s == "memory") return StoreType::Memory;
    if (s == "noop") return StoreType::NoOp;
    return std::unexpected {Error {ErrorCode::InvalidArg,
        "invalid store type: " + s + " (must be memory or noop)"}};
}

std::string toString(const RateLimitMode& mode) {
    switch (mode) {
        case RateLimitMode::PerTool: return "per-tool";
        case RateLimitMode::Global: return "global";
        case RateLimitMode::IpBased: return "ip-based";
        case RateLimitMode::Custom: return "custom";
    }
    std::unreachable();
}

std::string toString(const RateLimitAlgorithm& algorithm) {
    switch (algorithm) {
        case RateLimitAlgorithm::TokenBucket: return "token-bucket";
        case RateLimitAlgorithm::SlidingWindow: return "sliding-window";
    }
    std::unreachable();
}

std::string toString(const StoreType& store) {
    switch (store) {
        case StoreType::Memory: return "memory";
        case StoreType::NoOp: return "noop";
    }
    std::unreachable();
}

ToolRateLimit::ToolRateLimit(bool e, int l, std::chrono::milliseconds w)
    : enabled {e}, limit {l}, window {w} {
    if (!enabled) {
        return;
    }
    if (l <= 0) {
        throw std::invalid_argument("limit must be positive");
    }
    if (w <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("window must be positive");
    }
}

ToolRateLimit ToolRateLimit::defaults(bool enabled) {
    return ToolRateLimit {enabled, 50, std::chrono::minutes {1}};
}

RateLimitConfig::RateLimitConfig(
    bool e,
    int l,
    std::chrono::milliseconds w,
    RateLimitMode m,
    RateLimitAlgorithm a,
    StoreType s,
    std::string prefix)
    : enabled {e},
      limit {l},
      window {w},
      mode {m},
      algorithm {a},
      storeType {s},
      keyPrefix {std::move(prefix)},
      tools {} {
    if (!enabled) {
        return;
    }
    if (l <= 0) {
        throw std::invalid_argument("limit must be positive");
    }
    if (w <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("window must be positive");
    }
}

RateLimitConfig RateLimitConfig::defaults() {
    return RateLimitConfig {
        true,
        100,
        std::chrono::minutes {1},
        RateLimitMode::PerTool,
        RateLimitAlgorithm::TokenBucket,
        StoreType::Memory,
        "toolgate"
    };
}

} // namespace toolgate
