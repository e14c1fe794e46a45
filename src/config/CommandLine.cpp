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
#include "config/CommandLine.hpp"
#include "common/Error.hpp"
#include <fmt/format.h>
#include <string>
#include <vector>

namespace toolgate {

std::expected<CommandLine, Error> parseCommandLine(const std::vector<std::string>& args, const Getenv& getenv) {
    CommandLine cl {"", false, false, false};
    bool configGiven = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a == "--config" || a == "-c") {
            if (i + 1 == args.size()) {
                return std::unexpected {Error {ErrorCode::InvalidArg, a + " requires a path"}};
            }
            cl.configPath = args[++i];
            configGiven = true;
        } else if (a.starts_with("--config=")) {
            cl.configPath = a.substr(std::string {"--config="}.size());
            configGiven = true;
        } else if (a == "--print-config") {
            cl.printConfig = true;
        } else if (a == "--version" || a == "-v") {
            cl.showVersion = true;
        } else if (a == "--help" || a == "-h") {
            cl.showHelp = true;
        } else {
            return std::unexpected {Error {ErrorCode::InvalidArg, "unknown argument: " + a}};
        }
    }
    if (!configGiven) {
        if (auto env = getenv("TOOLGATE_CONFIG"); env.has_value()) {
            cl.configPath = env.value();
        }
    }
    return cl;
}

std::string usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [options]\n"
        "  -c, --config <path>  JSON configuration file (default: $TOOLGATE_CONFIG)\n"
        "      --print-config   print the effective configuration and exit\n"
        "  -v, --version        print the version and exit\n"
        "  -h, --help           show this help\n",
        program);
}

} // namespace toolgate
