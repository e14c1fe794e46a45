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
#ifndef TOOLGATE_TST_FAKE_TOOL_H
#define TOOLGATE_TST_FAKE_TOOL_H

#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>
#include "common/Context.hpp"
#include "common/Error.hpp"
#include "tools/Tool.hpp"

namespace toolgate::test {

// Scriptable tool: `behavior` decides each call's outcome and `calls` counts
// invocations. Arguments must be an object with a string "query".
class FakeTool final : public Tool {
public:
    using Behavior = std::function<std::expected<nlohmann::json, Error>(const Context&, const nlohmann::json&, int)>;

    explicit FakeTool(std::string n, Behavior b = {})
        : toolName {std::move(n)}, behavior {std::move(b)} {}

    std::string name() const override {
        return toolName;
    }

    std::string description() const override {
        return "fake tool " + toolName;
    }

    nlohmann::json inputSchema() const override {
        return {
            {"type", "object"},
            {"properties", {{"query", {{"type", "string"}}}}},
            {"required", {"query"}}
        };
    }

    std::expected<std::monostate, Error> validate(const nlohmann::json& args) const override {
        if (!args.is_object() || !args.contains("query") || !args.at("query").is_string()) {
            return std::unexpected {Error {ErrorCode::InvalidArg, "query is required"}};
        }
        return {};
    }

    std::expected<nlohmann::json, Error> call(const Context& ctx, const nlohmann::json& args) const override {
        const int n = calls.fetch_add(1);
        if (behavior) {
            return behavior(ctx, args, n);
        }
        return nlohmann::json {{"text", "echo: " + args.at("query").get<std::string>()}};
    }

    mutable std::atomic<int> calls {0};

private:
    std::string toolName;
    Behavior behavior;
};

// Behavior that blocks until the context is done and returns its error.
inline FakeTool::Behavior blockUntilDone() {
    return [](const Context& ctx, const nlohmann::json&, int) -> std::expected<nlohmann::json, Error> {
        static_cast<void>(ctx.sleepFor(std::chrono::seconds {30}));
        return std::unexpected {ctx.err().value_or(Error {ErrorCode::Internal, "not cancelled"})};
    };
}

} // namespace toolgate::test

#endif // TOOLGATE_TST_FAKE_TOOL_H
