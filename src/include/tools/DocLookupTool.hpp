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
#ifndef TOOLGATE_DOC_LOOKUP_TOOL_H
#define TOOLGATE_DOC_LOOKUP_TOOL_H

#include <expected>
#include <functional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Context.hpp"
#include "common/Error.hpp"
#include "common/Subprocess.hpp"
#include "tools/Tool.hpp"

namespace toolgate {

// "go-doc": runs `go doc <package>[.<symbol>]` and returns its output.
class DocLookupTool final : public Tool {
public:
    using Runner = std::function<std::expected<ProcessResult, Error>(
        const Context&, const std::vector<std::string>&, const std::string&)>;

    explicit DocLookupTool(std::string goBinary = "go", std::string workingDir = "", Runner runner = runProcess);

    std::string name() const override;
    std::string description() const override;
    nlohmann::json inputSchema() const override;
    std::expected<std::monostate, Error> validate(const nlohmann::json& args) const override;
    std::expected<nlohmann::json, Error> call(const Context& ctx, const nlohmann::json& args) const override;

    // Argument vector for the lookup, without the working directory.
    [[nodiscard]] std::vector<std::string> command(const std::string& packagePath, const std::string& symbol) const;
private:
    std::string resolveWorkingDir(const std::string& requested) const;
    std::string go;
    std::string defaultDir;
    Runner run;
};

std::expected<std::monostate, Error> validatePackagePath(const std::string& path);
// Identifier or Type.Method; empty is accepted.
std::expected<std::monostate, Error> validateSymbolName(const std::string& symbol);
std::expected<std::monostate, Error> validateFilePath(const std::string& path);

// Nearest directory at or above start holding a go.mod, empty if none.
std::string findGoModule(const std::string& start);

} // namespace toolgate

#endif // TOOLGATE_DOC_LOOKUP_TOOL_H
