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
#include "tools/DocLookupTool.hpp"
#include "common/Context.hpp"
#include "common/Error.hpp"
#include "common/Subprocess.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <array>
#include <filesystem>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace toolgate {

namespace {

const std::regex packagePathPattern {R"(^[a-zA-Z_][a-zA-Z0-9_.\-]*(/[a-zA-Z0-9_.\-]+)*$)"};
const std::regex symbolPattern {R"(^[a-zA-Z_][a-zA-Z0-9_]*(\.[a-zA-Z_][a-zA-Z0-9_]*)?$)"};
const std::regex filePathPattern {R"(^[a-zA-Z0-9_./\-]+$)"};

// Output go doc prints when the lookup target does not exist.
constexpr std::array<std::string_view, 4> notFoundMarkers {
    "no symbol",
    "no such package",
    "cannot find package",
    "is not in std",
};

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string stringArg(const nlohmann::json& args, const char* key) {
    if (!args.contains(key) || args.at(key).is_null()) {
        return "";
    }
    return args.at(key).get<std::string>();
}

} // namespace

std::expected<std::monostate, Error> validatePackagePath(const std::string& path) {
    if (trim(path).empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "package path cannot be empty"}};
    }
    if (path.find("..") != std::string::npos) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "package path cannot contain '..'"}};
    }
    if (!std::regex_match(path, packagePathPattern)) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "invalid Go package path format: " + path}};
    }
    return {};
}

std::expected<std::monostate, Error> validateSymbolName(const std::string& symbol) {
    if (symbol.empty()) {
        return {};
    }
    if (!std::regex_match(symbol, symbolPattern)) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "invalid Go symbol name: " + symbol}};
    }
    return {};
}

std::expected<std::monostate, Error> validateFilePath(const std::string& path) {
    if (path.empty()) {
        return {};
    }
    if (path.find("..") != std::string::npos) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "file path cannot contain '..'"}};
    }
    if (path.find('\0') != std::string::npos) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "file path cannot contain null bytes"}};
    }
    if (!std::regex_match(path, filePathPattern)) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "file path contains invalid characters"}};
    }
    return {};
}

std::string findGoModule(const std::string& start) {
    std::error_code ec;
    auto dir = std::filesystem::absolute(start, ec);
    if (ec) {
        return "";
    }
    for (;;) {
        if (std::filesystem::exists(dir / "go.mod", ec)) {
            return dir.string();
        }
        auto parent = dir.parent_path();
        if (parent == dir) {
            return "";
        }
        dir = std::move(parent);
    }
}

DocLookupTool::DocLookupTool(std::string goBinary, std::string workingDir, Runner runner)
    : go {std::move(goBinary)}, defaultDir {std::move(workingDir)}, run {std::move(runner)} {
    if (go.empty()) {
        throw std::invalid_argument("go binary cannot be empty");
    }
    if (!run) {
        throw std::invalid_argument("runner cannot be empty");
    }
}

std::string DocLookupTool::name() const {
    return "go-doc";
}

std::string DocLookupTool::description() const {
    return "Get Go documentation for a package or symbol";
}

nlohmann::json DocLookupTool::inputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"package_path", {{"type", "string"}, {"description", "The Go package path to query documentation for"}}},
            {"symbol_name", {{"type", "string"}, {"description", "Optional symbol name within the package"}}},
            {"working_dir", {{"type", "string"}, {"description", "Optional working directory with a go.mod file"}}}
        }},
        {"required", {"package_path"}}
    };
}

std::expected<std::monostate, Error> DocLookupTool::validate(const nlohmann::json& args) const {
    if (!args.is_object()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "arguments must be an object"}};
    }
    try {
        if (!args.contains("package_path")) {
            return std::unexpected {Error {ErrorCode::InvalidArg, "package_path is required"}};
        }
        if (auto r = validatePackagePath(stringArg(args, "package_path")); !r.has_value()) {
            return r;
        }
        if (auto r = validateSymbolName(stringArg(args, "symbol_name")); !r.has_value()) {
            return r;
        }
        return validateFilePath(stringArg(args, "working_dir"));
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected {Error {ErrorCode::InvalidArg, std::string {"invalid arguments: "} + e.what()}};
    }
}

std::vector<std::string> DocLookupTool::command(const std::string& packagePath, const std::string& symbol) const {
    if (symbol.empty()) {
        return {go, "doc", packagePath};
    }
    return {go, "doc", packagePath + "." + symbol};
}

std::string DocLookupTool::resolveWorkingDir(const std::string& requested) const {
    if (!requested.empty()) {
        return requested;
    }
    if (!defaultDir.empty()) {
        return defaultDir;
    }
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    return ec ? "" : findGoModule(cwd.string());
}

std::expected<nlohmann::json, Error> DocLookupTool::call(const Context& ctx, const nlohmann::json& args) const {
    if (auto valid = validate(args); !valid.has_value()) {
        return std::unexpected {valid.error()};
    }
    const auto packagePath = stringArg(args, "package_path");
    const auto symbol = stringArg(args, "symbol_name");
    const auto dir = resolveWorkingDir(stringArg(args, "working_dir"));

    spdlog::debug("go doc {}{}{} in '{}'", packagePath, symbol.empty() ? "" : ".", symbol, dir);
    auto result = run(ctx, command(packagePath, symbol), dir);
    if (!result.has_value()) {
        return std::unexpected {result.error()};
    }
    const auto output = trim(result->output);
    if (result->exitCode != 0) {
        const auto what = output.empty()
            ? fmt::format("go doc failed: exit status {}", result->exitCode)
            : fmt::format("go doc failed: exit status {}\nOutput: {}", result->exitCode, output);
        if (result->exitCode == 127) {
            return std::unexpected {Error {ErrorCode::Unavailable, what}};
        }
        for (const auto marker : notFoundMarkers) {
            if (output.find(marker) != std::string::npos) {
                return std::unexpected {Error {ErrorCode::NotFound, what}};
            }
        }
        return std::unexpected {Error {ErrorCode::ToolFailure, what}};
    }
    return nlohmann::json {
        {"package_path", packagePath},
        {"symbol_name", symbol},
        {"text", output}
    };
}

} // namespace toolgate
