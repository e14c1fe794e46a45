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
#ifndef TOOLGATE_TOOL_H
#define TOOLGATE_TOOL_H

#include <expected>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "common/Context.hpp"
#include "common/Error.hpp"

namespace toolgate {

class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    // JSON schema of the arguments object.
    virtual nlohmann::json inputSchema() const = 0;

    // Checked once per request, before rate limiting and retries.
    virtual std::expected<std::monostate, Error> validate(const nlohmann::json& args) const = 0;
    // May run several times for one request when retries are enabled. A
    // string "text" member of the result is what transports show callers.
    virtual std::expected<nlohmann::json, Error> call(const Context& ctx, const nlohmann::json& args) const = 0;
};

} // namespace toolgate

#endif // TOOLGATE_TOOL_H
