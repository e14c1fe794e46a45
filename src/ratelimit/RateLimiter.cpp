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
#include "ratelimit/RateLimiter.hpp"
#include "ratelimit/MemoryStore.hpp"
#include "ratelimit/NoOpStore.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace toolgate {

RateLimiter::RateLimiter(RateLimitConfig c, std::shared_ptr<CounterStore> s, MetricsSink& metrics)
    : cfg {std::move(c)}, store {std::move(s)}, toolConfigs {}, sink {metrics} {
    if (!store) {
        throw std::invalid_argument("Counter store must not be null.");
    }
    for (const auto& [tool, toolCfg] : cfg.tools) {
        toolConfigs.insert_or_assign(tool, toolCfg);
    }
    spdlog::debug("Rate limiter configured: enabled={}, limit={}, window={}ms, mode={}, algorithm={}",
        cfg.enabled, cfg.limit, cfg.window.count(), toString(cfg.mode), toString(cfg.algorithm));
}

std::pair<int, std::chrono::milliseconds> RateLimiter::effectiveLimit(const std::string& key) const {
    if (cfg.mode == RateLimitMode::PerTool) {
        const auto tool = extractToolName(key);
        if (!tool.empty()) {
            auto toolCfg = toolConfigs.get(tool);
            if (toolCfg.has_value() && toolCfg->enabled) {
                return {toolCfg->limit, toolCfg->window};
            }
        }
    }
    return {cfg.limit, cfg.window};
}

std::expected<bool, Error> RateLimiter::allow(const std::string& key) {
    if (!cfg.enabled) {
        return true;
    }
    const auto [limit, window] = effectiveLimit(key);
    auto count = store->increment(key, window);
    if (!count.has_value()) {
        spdlog::error("Failed to increment rate limit counter for {}: {}", key, count.error().what);
        return std::unexpected {Error {ErrorCode::StoreFailure, "rate limit store error: " + count.error().what}};
    }
    const bool allowed = count.value() <= limit;
    auto tool = extractToolName(key);
    if (tool.empty()) {
        tool = "unknown";
    }
    const auto mode = toString(cfg.mode);
    if (allowed) {
        sink.rateLimitAllowed(tool, mode);
        spdlog::debug("Rate limit check passed: key={}, count={}, limit={}", key, count.value(), limit);
    } else {
        sink.rateLimitRejected(tool, mode);
        spdlog::warn("Rate limit exceeded: key={}, count={}, limit={}, window={}ms", key, count.value(), limit, window.count());
    }
    sink.rateLimitCurrent(tool, mode, count.value());
    return allowed;
}

std::expected<RateLimitStats, Error> RateLimiter::stats(const std::string& key) const {
    const auto [limit, window] = effectiveLimit(key);
    auto count = store->get(key);
    if (!count.has_value()) {
        return std::unexpected {Error {ErrorCode::StoreFailure, "failed to get rate limit stats: " + count.error().what}};
    }
    return RateLimitStats {
        limit,
        window,
        count.value(),
        std::max(0, limit - count.value()),
        count.value() <= limit,
        std::chrono::system_clock::now() + window
    };
}

std::expected<std::monostate, Error> RateLimiter::reset(const std::string& key) {
    auto r = store->reset(key);
    if (!r.has_value()) {
        return std::unexpected {Error {ErrorCode::StoreFailure, "failed to reset rate limit: " + r.error().what}};
    }
    spdlog::debug("Rate limit counter reset: key={}", key);
    return {};
}

std::expected<std::monostate, Error> RateLimiter::setToolConfig(const std::string& tool, const ToolRateLimit& toolConfig) {
    try {
        const ToolRateLimit validated {toolConfig.enabled, toolConfig.limit, toolConfig.window};
        toolConfigs.insert_or_assign(tool, validated);
    } catch (const std::invalid_argument& e) {
        return std::unexpected {Error {ErrorCode::InvalidArg, std::string {"invalid tool config: "} + e.what()}};
    }
    spdlog::debug("Tool rate limit updated: tool={}, limit={}, window={}ms", tool, toolConfig.limit, toolConfig.window.count());
    return {};
}

ToolRateLimit RateLimiter::toolConfig(const std::string& tool) const {
    return toolConfigs.get(tool).value_or(ToolRateLimit::defaults(cfg.enabled));
}

std::string RateLimiter::generateKey(const std::string& tool, const std::string& clientId) const {
    return toolgate::generateKey(cfg.keyPrefix, cfg.mode, tool, clientId);
}

std::string RateLimiter::extractToolName(const std::string& key) const {
    return toolgate::extractToolName(cfg.keyPrefix, key);
}

const RateLimitConfig& RateLimiter::config() const {
    return cfg;
}

void RateLimiter::close() {
    store->close();
}

std::string generateKey(const std::string& prefix, RateLimitMode mode, const std::string& tool, const std::string& clientId) {
    std::string key;
    if (!prefix.empty()) {
        key += prefix;
        key += ':';
    }
    switch (mode) {
        case RateLimitMode::PerTool:
            key += "tool:";
            key += tool;
            if (!clientId.empty()) {
                key += ':';
                key += clientId;
            }
            break;
        case RateLimitMode::Global:
            key += "global:";
            key += clientId;
            break;
        case RateLimitMode::IpBased:
            key += "ip:";
            key += clientId;
            break;
        case RateLimitMode::Custom:
            key += clientId;
            break;
    }
    return key;
}

std::string extractToolName(const std::string& prefix, const std::string& key) {
    std::vector<std::string_view> parts;
    std::string_view rest {key};
    while (true) {
        auto pos = rest.find(':');
        parts.push_back(rest.substr(0, pos));
        if (pos == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(pos + 1);
    }
    std::size_t i = 0;
    if (!prefix.empty()) {
        if (parts[0] != prefix) {
            return {};
        }
        i = 1;
    }
    if (parts.size() >= i + 2 && parts[i] == "tool") {
        return std::string {parts[i + 1]};
    }
    return {};
}

std::shared_ptr<CounterStore> makeCounterStore(StoreType type) {
    switch (type) {
        case StoreType::Memory:
            return std::make_shared<MemoryStore>();
        case StoreType::NoOp:
            return std::make_shared<NoOpStore>();
    }
    std::unreachable();
}

} // namespace toolgate
