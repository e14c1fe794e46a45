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
#include "server/ToolDispatcher.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include "ratelimit/RateLimiter.hpp"
#include "resilience/InstrumentedRepeater.hpp"
#include "resilience/Repeater.hpp"
#include "tools/DocLookupTool.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolgate {

ToolDispatcher::ToolDispatcher(const Config& config, const std::vector<std::shared_ptr<Tool>>& tools, MetricsSink& metrics)
    : registry {},
      rateLimiter {},
      pipelines {},
      sink {metrics} {
    auto rl = config.rateLimitConfig();
    auto store = makeCounterStore(rl.storeType);
    rateLimiter = std::make_shared<RateLimiter>(std::move(rl), std::move(store), sink);

    for (const auto& tool : tools) {
        if (auto added = registry.add(tool); !added.has_value()) {
            throw std::invalid_argument(added.error().what);
        }
        const auto name = tool->name();
        auto breaker = std::make_shared<CircuitBreaker>(config.circuitBreakerConfig(name), sink);
        std::optional<InstrumentedRepeater> retry;
        if (auto policy = config.retryPolicy(name); policy.has_value()) {
            retry.emplace(name, std::make_shared<const Repeater>(policy.value(), retriableFor(name)), sink);
        }
        pipelines.emplace(name, std::make_unique<Pipeline>(
            name, std::move(breaker), rateLimiter, std::move(retry), config.toolTimeout(name), sink));
        spdlog::info("Registered tool {} (timeout {}, retries {})",
            name, formatDuration(config.toolTimeout(name)), pipelines.at(name)->retries() ? "on" : "off");
    }
}

ToolDispatcher::~ToolDispatcher() {
    close();
}

std::expected<nlohmann::json, Error> ToolDispatcher::callTool(
    const Context& ctx,
    const std::string& name,
    const nlohmann::json& args,
    const std::string& clientId) const {
    auto tool = registry.find(name);
    if (!tool.has_value()) {
        return std::unexpected {tool.error()};
    }
    if (auto valid = tool.value()->validate(args); !valid.has_value()) {
        spdlog::debug("Rejected {} call: {}", name, valid.error().what);
        sink.toolCall(name, category(valid.error().code), std::chrono::microseconds::zero());
        return std::unexpected {valid.error()};
    }
    const auto& p = pipelines.at(name);
    return p->execute(ctx, clientId, [&tool, &args](const Context& c, int) {
        return tool.value()->call(c, args);
    });
}

bool ToolDispatcher::hasTool(const std::string& name) const {
    return pipelines.contains(name);
}

nlohmann::json ToolDispatcher::listTools() const {
    auto out = nlohmann::json::array();
    for (const auto& tool : registry.list()) {
        out.push_back({
            {"name", tool->name()},
            {"description", tool->description()},
            {"inputSchema", tool->inputSchema()}
        });
    }
    return out;
}

std::vector<std::shared_ptr<CircuitBreaker>> ToolDispatcher::breakers() const {
    std::vector<std::shared_ptr<CircuitBreaker>> out;
    out.reserve(pipelines.size());
    for (const auto& [name, p] : pipelines) {
        out.push_back(p->breaker());
    }
    return out;
}

const std::shared_ptr<RateLimiter>& ToolDispatcher::limiter() const {
    return rateLimiter;
}

const Pipeline& ToolDispatcher::pipeline(const std::string& tool) const {
    auto it = pipelines.find(tool);
    if (it == pipelines.end()) {
        throw std::out_of_range("no pipeline for tool: " + tool);
    }
    return *it->second;
}

MetricsSink& ToolDispatcher::metrics() const {
    return sink;
}

void ToolDispatcher::close() {
    if (rateLimiter) {
        rateLimiter->close();
    }
}

std::vector<std::shared_ptr<Tool>> builtinTools(const Config& config) {
    return {
        std::make_shared<DocLookupTool>(config.docLookup.goBinary, config.docLookup.workingDir)
    };
}

} // namespace toolgate
