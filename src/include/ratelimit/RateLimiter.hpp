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
#ifndef TOOLGATE_RATE_LIMITER_H
#define TOOLGATE_RATE_LIMITER_H

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include "common/Error.hpp"
#include "common/LockedUnorderedMap.hpp"
#include "common/Metrics.hpp"
#include "ratelimit/CounterStore.hpp"
#include "ratelimit/RateLimitConfig.hpp"

namespace toolgate {

struct RateLimitStats {
    int limit;
    std::chrono::milliseconds window;
    int current;
    int remaining;
    bool allowed;
    std::chrono::system_clock::time_point resetTime;
};

class RateLimiter {
public:
    RateLimiter(RateLimitConfig c, std::shared_ptr<CounterStore> s, MetricsSink& metrics = noopMetrics());
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Counts the request against key. A store failure is returned to the
    // caller, which decides whether to fail open.
    std::expected<bool, Error> allow(const std::string& key);
    // Reads the counter without consuming a request.
    std::expected<RateLimitStats, Error> stats(const std::string& key) const;
    std::expected<std::monostate, Error> reset(const std::string& key);

    std::expected<std::monostate, Error> setToolConfig(const std::string& tool, const ToolRateLimit& toolConfig);
    // Falls back to the default tool limits when none is registered.
    [[nodiscard]] ToolRateLimit toolConfig(const std::string& tool) const;

    [[nodiscard]] std::string generateKey(const std::string& tool, const std::string& clientId) const;
    [[nodiscard]] std::string extractToolName(const std::string& key) const;
    [[nodiscard]] const RateLimitConfig& config() const;
    void close();
private:
    [[nodiscard]] std::pair<int, std::chrono::milliseconds> effectiveLimit(const std::string& key) const;
    RateLimitConfig cfg;
    std::shared_ptr<CounterStore> store;
    LockedUnorderedMap<std::string, ToolRateLimit> toolConfigs;
    MetricsSink& sink;
};

// Key layout per mode, with "<prefix>:" omitted for an empty prefix:
//   per-tool  <prefix>:tool:<tool>[:<clientId>]
//   global    <prefix>:global:<clientId>
//   ip-based  <prefix>:ip:<clientId>
//   custom    <prefix>:<clientId>
std::string generateKey(const std::string& prefix, RateLimitMode mode, const std::string& tool, const std::string& clientId);

// Tool segment of a per-tool key, empty for any other key.
std::string extractToolName(const std::string& prefix, const std::string& key);

std::shared_ptr<CounterStore> makeCounterStore(StoreType type);

} // namespace toolgate

#endif // TOOLGATE_RATE_LIMITER_H
