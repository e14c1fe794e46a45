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
#include "common/Signals.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <ctime>
#include <functional>
#include <pthread.h>
#include <stdexcept>
#include <utility>

namespace toolgate {

SignalWaiter::SignalWaiter() : signals {}, active {false} {
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        throw std::runtime_error("Failed to block termination signals");
    }
}

SignalWaiter::~SignalWaiter() {
    stop();
}

void SignalWaiter::start(std::function<void(int)> handler) {
    if (active.exchange(true)) {
        throw std::logic_error("SignalWaiter already started");
    }
    watcher = std::thread([this, handler = std::move(handler)]() {
        const timespec poll {0, 200'000'000};
        while (active.load()) {
            const int sig = sigtimedwait(&signals, nullptr, &poll);
            if (sig == -1) {
                continue;
            }
            spdlog::info("Received signal {}, shutting down", sig);
            handler(sig);
        }
    });
}

void SignalWaiter::stop() {
    active.store(false);
    if (watcher.joinable() && watcher.get_id() != std::this_thread::get_id()) {
        watcher.join();
    }
}

} // namespace toolgate
