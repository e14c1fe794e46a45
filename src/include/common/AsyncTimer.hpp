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
#ifndef TOOLGATE_ASYNC_TIMER_H
#define TOOLGATE_ASYNC_TIMER_H

#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>
#include <condition_variable>

namespace toolgate {

// Runs a callback on a background thread every interval until stopped.
class AsyncTimer {
public:
    AsyncTimer();
    void start(std::chrono::milliseconds interval, std::function<void()> callback);
    void stop();
    [[nodiscard]] bool running() const;
    ~AsyncTimer();
    AsyncTimer(const AsyncTimer&) = delete;
    AsyncTimer& operator=(const AsyncTimer&) = delete;
    AsyncTimer(AsyncTimer&&) = delete;
    AsyncTimer& operator=(AsyncTimer&&) = delete;
private:
    std::atomic<bool> active;
    std::thread worker;
    std::mutex mtx;
    std::condition_variable cv;
};

} // namespace toolgate

#endif // TOOLGATE_ASYNC_TIMER_H
