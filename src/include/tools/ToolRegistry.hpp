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
#ifndef TOOLGATE_TOOL_REGISTRY_H
#define TOOLGATE_TOOL_REGISTRY_H

#include <expected>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "common/Error.hpp"
#include "common/LockedUnorderedMap.hpp"
#include "tools/Tool.hpp"

namespace toolgate {

class ToolRegistry {
public:
    // InvalidArg for a null tool or a name already taken.
    std::expected<std::monostate, Error> add(std::shared_ptr<Tool> tool);
    std::expected<std::shared_ptr<Tool>, Error> find(const std::string& name) const;
    bool remove(const std::string& name);
    // Sorted by name.
    std::vector<std::shared_ptr<Tool>> list() const;
    size_t size() const;
private:
    LockedUnorderedMap<std::string, std::shared_ptr<Tool>> tools;
};

} // namespace toolgate

#endif // TOOLGATE_TOOL_REGISTRY_H
