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
#ifndef TOOLGATE_TOOL_DISPATCHER_H
#define TOOLGATE_TOOL_DISPATCHER_H

#include <expected>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Context.hpp"
#include "common/Error.hpp"
#include "common/Metrics.hpp"
#include "config/Config.hpp"
#include "ratelimit/RateLimiter.hpp"
#include "resilience/CircuitBreaker.hpp"
#include "resilience/Pipeline.hpp"
#include "tools/Tool.hpp"
#include "tools/ToolRegistry.hpp"

namespace toolgate {

// Routes tool calls through a per-tool resilience pipeline. Every tool gets
// its own breaker, retry executor and timeout; the limiter and its store
// are shared.
class ToolDispatcher {
public:
    // Throws std::invalid_argument on invalid configuration or duplicate tools.
    ToolDispatcher(const Config& config, const std::vector<std::shared_ptr<Tool>>& tools, MetricsSink& metrics = noopMetrics());
    ~ToolDispatcher();
    ToolDispatcher(const ToolDispatcher&) = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;

    std::expected<nlohmann::json, Error> callTool(
        const Context& ctx,
        const std::string& name,
        const nlohmann::json& args,
        const std::string& clientId = "") const;

    [[nodiscard]] bool hasTool(const std::string& name) const;
    // [{name, description, inputSchema}] sorted by name.
    [[nodiscard]] nlohmann::json listTools() const;
    [[nodiscard]] std::vector<std::shared_ptr<CircuitBreaker>> breakers() const;
    [[nodiscard]] const std::shared_ptr<RateLimiter>& limiter() const;
    [[nodiscard]] const Pipeline& pipeline(const std::string& tool) const;
    [[nodiscard]] MetricsSink& metrics() const;
    void close();
private:
    ToolRegistry registry;
    std::shared_ptr<RateLimiter> rateLimiter;
    std::map<std::string, std::unique_ptr<Pipeline>> pipelines;
    MetricsSink& sink;
};

// Tools implemented in-process: go-doc.
std::vector<std::shared_ptr<Tool>> builtinTools(const Config& config);

} // namespace toolgate

#endif // TOOLGATE_TOOL_DISPATCHER_H
