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
#ifndef TOOLGATE_SIGNALS_H
#define TOOLGATE_SIGNALS_H

#include <atomic>
#include <csignal>
#include <signal.h>
#include <functional>
#include <thread>

namespace toolgate {

// Blocks SIGINT and SIGTERM in the calling thread, so construct it in main
// before any other thread starts; threads created later inherit the mask.
// After start(), a watcher thread invokes the handler for each signal.
class SignalWaiter {
public:
    SignalWaiter();
    ~SignalWaiter();
    SignalWaiter(const SignalWaiter&) = delete;
    SignalWaiter& operator=(const SignalWaiter&) = delete;

    void start(std::function<void(int)> handler);
    void stop();
private:
    sigset_t signals;
    std::atomic<bool> active;
    std::thread watcher;
};

} // namespace toolgate

#endif // TOOLGATE_SIGNALS_H
