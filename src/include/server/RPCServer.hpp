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
#ifndef TOOLGATE_RPC_SERVER_H
#define TOOLGATE_RPC_SERVER_H

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include "common/Util.hpp"

namespace toolgate {

// Serves one gRPC service from a background thread. Shutdown gives
// in-flight calls the drain timeout before the server cancels them.
template<typename Service>
class RPCServer {
public:
    RPCServer(const std::string& address, Service& s, std::chrono::microseconds shutdownTimeout = std::chrono::seconds {30});
    ~RPCServer();
    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;
    RPCServer(RPCServer&&) = delete;
    RPCServer& operator=(RPCServer&&) = delete;
    // Port actually bound, useful when listening on port 0.
    [[nodiscard]] int port() const;
    void shutdown();
private:
    std::string addr;
    Service& service;
    std::chrono::microseconds drainTimeout;
    int boundPort;
    std::unique_ptr<grpc::Server> server;
    std::thread waiter;
};

template<typename Service>
RPCServer<Service>::RPCServer(const std::string& address, Service& s, std::chrono::microseconds shutdownTimeout)
    : addr {address}, service {s}, drainTimeout {shutdownTimeout}, boundPort {0} {
    grpc::ServerBuilder builder {};
    builder.AddListeningPort(addr, grpc::InsecureServerCredentials(), &boundPort);
    builder.RegisterService(&service);
    server = builder.BuildAndStart();
    if (!server || boundPort == 0) {
        throw std::runtime_error("failed to start gRPC server on " + addr);
    }
    spdlog::info("gRPC server listening on {} (port {})", addr, boundPort);
    waiter = std::thread([this]() { server->Wait(); });
}

template<typename Service>
int RPCServer<Service>::port() const {
    return boundPort;
}

template<typename Service>
void RPCServer<Service>::shutdown() {
    if (!server) {
        return;
    }
    spdlog::info("Draining gRPC server for up to {}", formatDuration(drainTimeout));
    server->Shutdown(std::chrono::system_clock::now()
        + std::chrono::duration_cast<std::chrono::system_clock::duration>(drainTimeout));
    if (waiter.joinable()) {
        waiter.join();
    }
    server.reset();
}

template<typename Service>
RPCServer<Service>::~RPCServer() {
    shutdown();
}

} // namespace toolgate

#endif // TOOLGATE_RPC_SERVER_H
