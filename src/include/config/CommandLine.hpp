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
#ifndef TOOLGATE_COMMAND_LINE_H
#define TOOLGATE_COMMAND_LINE_H

#include <expected>
#include <string>
#include <vector>
#include "common/Error.hpp"
#include "config/Config.hpp"

namespace toolgate {

struct CommandLine {
    // From --config, falling back to TOOLGATE_CONFIG.
    std::string configPath;
    bool printConfig;
    bool showVersion;
    bool showHelp;
};

// args excludes the program name.
std::expected<CommandLine, Error> parseCommandLine(const std::vector<std::string>& args, const Getenv& getenv = systemGetenv);

std::string usage(const std::string& program);

} // namespace toolgate

#endif // TOOLGATE_COMMAND_LINE_H
