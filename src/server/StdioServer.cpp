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
#include "server/StdioServer.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include "server/JsonRpc.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace toolgate {

namespace {

constexpr const char* protocolVersion = "2024-11-05";
// Bounds how long shutdown() waits for a blocked read to notice.
constexpr int pollIntervalMs = 200;

bool blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Id to answer when a line could not be handed to a worker. Empty for
// notifications.
std::optional<nlohmann::json> replyId(const std::string& line) {
    const auto message = nlohmann::json::parse(line, nullptr, false);
    if (!message.is_object()) {
        return nlohmann::json {};
    }
    if (!message.contains("id")) {
        return std::nullopt;
    }
    return message.at("id");
}

} // namespace

StdioServer::StdioServer(
    ServerSettings settings,
    std::chrono::microseconds shutdownTimeout,
    ToolDispatcher& dispatcher,
    const HealthChecker& health,
    const InMemoryMetrics* metrics,
    size_t maxConcurrent,
    Spawner spawner)
    : server {std::move(settings)},
      drainTimeout {shutdownTimeout},
      tools {dispatcher},
      healthChecker {health},
      inMemoryMetrics {metrics},
      maxInFlight {maxConcurrent},
      spawn {std::move(spawner)},
      root {},
      stopping {false},
      inFlight {0} {
    if (maxInFlight == 0) {
        throw std::invalid_argument("StdioServer needs room for at least one request");
    }
    if (!spawn) {
        throw std::invalid_argument("StdioServer needs a spawner");
    }
}

void StdioServer::detachedThread(std::function<void()> work) {
    std::thread(std::move(work)).detach();
}

void StdioServer::serve(std::istream& in, std::ostream& out) {
    spdlog::info("{} {} serving JSON-RPC on stdio", server.name, server.version);
    std::string line;
    while (!stopping.load() && std::getline(in, line)) {
        submit(line, out);
    }
    spdlog::info("Input closed, draining requests");
    drain();
}

void StdioServer::serve(int fd, std::ostream& out) {
    spdlog::info("{} {} serving JSON-RPC on stdio", server.name, server.version);
    std::string pending;
    std::array<char, 4096> buf {};
    while (!stopping.load()) {
        pollfd pfd {fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, pollIntervalMs);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll on input failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }
        const ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n == -1) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            spdlog::error("read on input failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }
        pending.append(buf.data(), static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            submit(pending.substr(0, newline), out);
            pending.erase(0, newline + 1);
        }
    }
    if (!stopping.load() && !pending.empty()) {
        submit(pending, out);
    }
    spdlog::info("Input closed, draining requests");
    drain();
}

void StdioServer::submit(const std::string& line, std::ostream& out) {
    if (blank(line)) {
        return;
    }
    {
        std::unique_lock lock {m};
        cv.wait(lock, [this] { return inFlight < maxInFlight; });
        ++inFlight;
    }
    try {
        spawn([this, line, &out]() {
            auto response = handleLine(line);
            if (!response.is_null()) {
                write(out, response);
            }
            finish();
        });
    } catch (const std::system_error& e) {
        finish();
        spdlog::error("Cannot start request worker: {}", e.what());
        if (auto id = replyId(line); id.has_value()) {
            write(out, jsonrpc::makeError(id.value(), jsonrpc::internalError, "server busy"));
        }
    }
}

void StdioServer::finish() {
    std::lock_guard lock {m};
    --inFlight;
    cv.notify_all();
}

void StdioServer::drain() {
    std::unique_lock lock {m};
    if (!cv.wait_for(lock, drainTimeout, [this] { return inFlight == 0; })) {
        spdlog::warn("{} requests still running after {}, cancelling", inFlight, formatDuration(drainTimeout));
        root.cancel();
        cv.wait(lock, [this] { return inFlight == 0; });
    }
}

void StdioServer::shutdown() {
    stopping.store(true);
    root.cancel();
}

void StdioServer::write(std::ostream& out, const nlohmann::json& response) {
    const auto text = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard lock {outMutex};
    out << text << '\n';
    out.flush();
}

nlohmann::json StdioServer::handleLine(const std::string& line) const {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("Unparseable request: {}", e.what());
        return jsonrpc::makeError(nullptr, jsonrpc::parseError, "parse error");
    }
    return handle(message);
}

nlohmann::json StdioServer::handle(const nlohmann::json& message) const {
    auto request = jsonrpc::parseRequest(message);
    if (!request.has_value()) {
        return jsonrpc::makeError(message.is_object() ? message.value("id", nlohmann::json {}) : nlohmann::json {},
            jsonrpc::invalidRequest, request.error());
    }
    const auto& r = request.value();
    if (r.notification) {
        spdlog::debug("Notification {}", r.method);
        return nullptr;
    }
    try {
        if (r.method == "tools/call") {
            return callTool(r.id, r.params);
        }
        auto result = dispatch(r.method);
        if (!result.has_value()) {
            return jsonrpc::makeError(r.id, jsonrpc::methodNotFound, "method not found: " + r.method);
        }
        return jsonrpc::makeResult(r.id, result.value());
    } catch (const nlohmann::json::exception& e) {
        return jsonrpc::makeError(r.id, jsonrpc::invalidParams, std::string {"invalid params: "} + e.what());
    }
}

std::optional<nlohmann::json> StdioServer::dispatch(const std::string& method) const {
    if (method == "initialize") {
        return nlohmann::json {
            {"protocolVersion", protocolVersion},
            {"serverInfo", {{"name", server.name}, {"version", server.version}}},
            {"capabilities", {{"tools", nlohmann::json::object()}}}
        };
    }
    if (method == "tools/list") {
        return nlohmann::json {{"tools", tools.listTools()}};
    }
    if (method == "health") {
        return toJson(healthChecker.check());
    }
    if (method == "metrics") {
        nlohmann::json out {
            {"counters", nlohmann::json::object()},
            {"gauges", nlohmann::json::object()}
        };
        if (inMemoryMetrics != nullptr) {
            const auto snapshot = inMemoryMetrics->snapshot();
            for (const auto& [k, v] : snapshot.counters) {
                out["counters"][k] = v;
            }
            for (const auto& [k, v] : snapshot.gauges) {
                out["gauges"][k] = v;
            }
        }
        return out;
    }
    if (method == "ping") {
        return nlohmann::json::object();
    }
    return std::nullopt;
}

nlohmann::json StdioServer::callTool(const nlohmann::json& id, const nlohmann::json& params) const {
    if (!params.is_object() || !params.contains("name") || !params.at("name").is_string()) {
        return jsonrpc::makeError(id, jsonrpc::invalidParams, "tools/call requires a string name");
    }
    const auto name = params.at("name").get<std::string>();
    if (!tools.hasTool(name)) {
        return jsonrpc::makeError(id, jsonrpc::toolNotFound, "unknown tool: " + name);
    }
    const auto args = params.value("arguments", nlohmann::json::object());
    const auto clientId = params.value("clientId", std::string {});
    const auto requestId = newRequestId();

    spdlog::debug("[{}] tools/call {} client '{}'", requestId, name, clientId);
    auto result = tools.callTool(root.withCancel(), name, args, clientId);
    if (!result.has_value()) {
        spdlog::info("[{}] {} failed: {}", requestId, name, result.error().what);
        return jsonrpc::fromError(id, result.error());
    }
    const auto& value = result.value();
    const auto text = value.is_object() && value.contains("text") && value.at("text").is_string()
        ? value.at("text").get<std::string>()
        : value.dump();
    return jsonrpc::makeResult(id, {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
        {"structuredContent", value},
        {"isError", false}
    });
}

} // namespace toolgate
