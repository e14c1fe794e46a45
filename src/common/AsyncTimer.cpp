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
#include "common/AsyncTimer.hpp"
#include <thread>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace toolgate {

AsyncTimer::AsyncTimer() : active(false), mtx{}, cv{} {}

void AsyncTimer::start(std::chrono::milliseconds interval, std::function<void()> callback) {
    if (interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Timer interval must be positive.");
    }
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (active || worker.joinable()) {
            throw std::logic_error("Timer already started.");
        }
        active = true;
    }
    worker = std::thread([this, interval, callback = std::move(callback)]() {
        while (true) {
            std::unique_lock<std::mutex> lock(mtx);
            if (!active) break;
            if (cv.wait_for(lock, interval, [this]{ return !active; })) break;
            lock.unlock();
            callback();
        }
    });
}

void AsyncTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        active = false;
    }
    cv.notify_all();
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    }
}

bool AsyncTimer::running() const {
    return active.load();
}

AsyncTimer::~AsyncTimer() {
    stop();
}

} // namespace toolgate
