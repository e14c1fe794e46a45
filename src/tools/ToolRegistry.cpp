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
#include "tools/ToolRegistry.hpp"
#include "common/Error.hpp"
#include "tools/Tool.hpp"
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace toolgate {

std::expected<std::monostate, Error> ToolRegistry::add(std::shared_ptr<Tool> tool) {
    if (!tool) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "tool cannot be null"}};
    }
    const auto name = tool->name();
    const bool added = tools.upsert(name, [&tool](std::shared_ptr<Tool>& slot, bool inserted) {
        if (inserted) {
            slot = std::move(tool);
        }
        return inserted;
    });
    if (!added) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "tool already registered: " + name}};
    }
    return {};
}

std::expected<std::shared_ptr<Tool>, Error> ToolRegistry::find(const std::string& name) const {
    auto tool = tools.get(name);
    if (!tool.has_value()) {
        return std::unexpected {Error {ErrorCode::NotFound, "unknown tool: " + name}};
    }
    return tool.value();
}

bool ToolRegistry::remove(const std::string& name) {
    return tools.erase(name);
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::list() const {
    std::vector<std::shared_ptr<Tool>> out;
    tools.forEach([&out](const std::string&, const std::shared_ptr<Tool>& tool) {
        out.push_back(tool);
    });
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a->name() < b->name(); });
    return out;
}

size_t ToolRegistry::size() const {
    return tools.size();
}

} // namespace toolgate
