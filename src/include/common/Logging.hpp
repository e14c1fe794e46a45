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
#ifndef TOOLGATE_LOGGING_H
#define TOOLGATE_LOGGING_H

#include <cstddef>
#include <expected>
#include <variant>
#include <string>
#include <spdlog/common.h>
#include "common/Error.hpp"

namespace toolgate {

struct LoggingConfig {
    std::string level {"info"};
    // Rotating log file; empty logs to stderr only.
    std::string file {};
    std::size_t maxFileSize {1024 * 1024 * 5};
    std::size_t maxFiles {3};
    bool async {true};
};

std::expected<spdlog::level::level_enum, Error> parseLogLevel(const std::string& level);

// Installs the "toolgate" default logger. Console output goes to stderr since
// stdout carries the RPC stream.
std::expected<std::monostate, Error> initLogging(const LoggingConfig& config);

} // namespace toolgate

#endif // TOOLGATE_LOGGING_H
