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
#include <iostream>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "common/Logging.hpp"
#include "common/Metrics.hpp"
#include "common/Signals.hpp"
#include "config/CommandLine.hpp"
#include "config/Config.hpp"
#include "server/HealthChecker.hpp"
#include "server/ToolDispatcher.hpp"
#include "server/ToolServiceImpl.hpp"

using toolgate::builtinTools;
using toolgate::HealthChecker;
using toolgate::InMemoryMetrics;
using toolgate::SignalWaiter;
using toolgate::ToolDispatcher;
using toolgate::ToolServer;
using toolgate::ToolServiceImpl;

int main(int argc, char** argv) {
    SignalWaiter signals {};
    const std::vector<std::string> args(argv + 1, argv + argc);
    auto cl = toolgate::parseCommandLine(args);
    if (!cl.has_value()) {
        std::cerr << cl.error().what << '\n' << toolgate::usage(argv[0]);
        return 2;
    }
    if (cl->showHelp) {
        std::cout << toolgate::usage(argv[0]);
        return 0;
    }
    auto config = toolgate::loadConfig(cl->configPath);
    if (!config.has_value()) {
        std::cerr << "toolgate-grpc: " << config.error().what << '\n';
        return 1;
    }
    if (cl->showVersion) {
        std::cout << config->server.name << ' ' << config->server.version << '\n';
        return 0;
    }
    if (cl->printConfig) {
        std::cout << toolgate::toJson(config.value()).dump(2) << '\n';
        return 0;
    }
    if (auto logging = toolgate::initLogging(config->logging); !logging.has_value()) {
        std::cerr << "toolgate-grpc: " << logging.error().what << '\n';
        return 1;
    }

    int status = 0;
    try {
        InMemoryMetrics metrics {};
        ToolDispatcher dispatcher {config.value(), builtinTools(config.value()), metrics};
        const HealthChecker health {config->server.version, dispatcher.breakers()};
        ToolServiceImpl service {dispatcher, health};
        ToolServer server {config->server.listenAddress, service, config->timeouts.shutdown};

        std::mutex m;
        std::condition_variable cv;
        bool stop = false;
        signals.start([&](int) {
            std::lock_guard lock {m};
            stop = true;
            cv.notify_all();
        });
        {
            std::unique_lock lock {m};
            cv.wait(lock, [&stop] { return stop; });
        }
        server.shutdown();
        service.cancelAll();
        signals.stop();
        dispatcher.close();
        spdlog::info("Shutdown complete");
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        status = 1;
    } catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
        status = 1;
    }
    spdlog::shutdown();
    return status;
}
