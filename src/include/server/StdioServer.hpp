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
#ifndef TOOLGATE_STDIO_SERVER_H
#define TOOLGATE_STDIO_SERVER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "common/Context.hpp"
#include "common/Metrics.hpp"
#include "config/Config.hpp"
#include "server/HealthChecker.hpp"
#include "server/ToolDispatcher.hpp"

namespace toolgate {

// Line-delimited JSON-RPC 2.0: one request per input line, one response
// per output line. Requests run concurrently on their own threads and
// responses are written whole, in completion order.
class StdioServer {
public:
    // Runs one request to completion off the reading thread. Throws
    // std::system_error when no worker can be started.
    using Spawner = std::function<void(std::function<void()>)>;
    static constexpr size_t defaultMaxConcurrent = 64;

    // Reading pauses while maxConcurrent requests are running.
    StdioServer(
        ServerSettings settings,
        std::chrono::microseconds shutdownTimeout,
        ToolDispatcher& dispatcher,
        const HealthChecker& health,
        const InMemoryMetrics* metrics = nullptr,
        size_t maxConcurrent = defaultMaxConcurrent,
        Spawner spawner = detachedThread);
    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    // Returns at EOF or after shutdown(), once in-flight requests are done.
    // Requests still running after the shutdown timeout are cancelled.
    void serve(std::istream& in, std::ostream& out);
    // Same, reading the descriptor directly so shutdown() is noticed while
    // no input arrives.
    void serve(int fd, std::ostream& out);
    // Stops reading and cancels in-flight requests.
    void shutdown();

    // Response to one message, null for notifications.
    nlohmann::json handle(const nlohmann::json& message) const;
    nlohmann::json handleLine(const std::string& line) const;

    static void detachedThread(std::function<void()> work);
private:
    // Empty for an unknown method.
    std::optional<nlohmann::json> dispatch(const std::string& method) const;
    nlohmann::json callTool(const nlohmann::json& id, const nlohmann::json& params) const;
    void submit(const std::string& line, std::ostream& out);
    void finish();
    void write(std::ostream& out, const nlohmann::json& response);
    void drain();

    ServerSettings server;
    std::chrono::microseconds drainTimeout;
    ToolDispatcher& tools;
    const HealthChecker& healthChecker;
    const InMemoryMetrics* inMemoryMetrics;
    size_t maxInFlight;
    Spawner spawn;
    Context root;
    std::atomic<bool> stopping;
    std::mutex outMutex;
    std::mutex m;
    std::condition_variable cv;
    size_t inFlight;
};

} // namespace toolgate

#endif // TOOLGATE_STDIO_SERVER_H
