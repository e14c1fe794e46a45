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
#include "common/Logging.hpp"
#include "common/Error.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/common.h>
#include "spdlog/async.h"
#include "spdlog/async_logger.h"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace toolgate {

std::expected<spdlog::level::level_enum, Error> parseLogLevel(const std::string& level) {
    std::string l {level};
    std::transform(l.begin(), l.end(), l.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (l == "trace") return spdlog::level::trace;
    if (l == "debug") return spdlog::level::debug;
    if (l == "info") return spdlog::level::info;
    if (l == "warn" || l == "warning") return spdlog::level::warn;
    if (l == "error") return spdlog::level::err;
    if (l == "critical" || l == "fatal") return spdlog::level::critical;
    if (l == "off") return spdlog::level::off;
    return std::unexpected {Error {ErrorCode::InvalidArg, "invalid log level: " + level}};
}

std::expected<std::monostate, Error> initLogging(const LoggingConfig& config) {
    auto level = parseLogLevel(config.level);
    if (!level.has_value()) {
        return std::unexpected {level.error()};
    }
    std::vector<spdlog::sink_ptr> sinks {std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.maxFileSize, config.maxFiles));
        } catch (const spdlog::spdlog_ex& e) {
            return std::unexpected {Error {ErrorCode::InvalidArg, std::string {"failed to open log file: "} + e.what()}};
        }
    }
    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(8192, 1);
        logger = std::make_shared<spdlog::async_logger>(
            "toolgate", sinks.begin(), sinks.end(),
            spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    } else {
        logger = std::make_shared<spdlog::logger>("toolgate", sinks.begin(), sinks.end());
    }
    logger->set_level(level.value());
    spdlog::drop("toolgate");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    return {};
}

} // namespace toolgate
