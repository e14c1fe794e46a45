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
#ifndef TOOLGATE_MEMORY_STORE_H
#define TOOLGATE_MEMORY_STORE_H

#include <chrono>
#include <cstddef>
#include <string>
#include "common/AsyncTimer.hpp"
#include "common/LockedUnorderedMap.hpp"
#include "ratelimit/CounterStore.hpp"

namespace toolgate {

class MemoryStore final : public CounterStore {
public:
    struct Bucket {
        int count {0};
        std::chrono::steady_clock::time_point windowStart {};
        std::chrono::steady_clock::time_point lastUpdate {};
        std::chrono::milliseconds window {0};
    };

    // Evicts every 5 minutes, dropping buckets idle for 10 minutes.
    MemoryStore();
    MemoryStore(std::chrono::milliseconds cleanupInterval, std::chrono::milliseconds idleExpiry);
    ~MemoryStore() override;
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::expected<int, Error> increment(const std::string& key, std::chrono::milliseconds window) override;
    std::expected<int, Error> get(const std::string& key) const override;
    std::expected<std::monostate, Error> reset(const std::string& key) override;
    std::expected<std::monostate, Error> erase(const std::string& key) override;
    void close() override;

    // Stops background eviction. Idempotent.
    void stop();
    // One eviction pass; returns the number of buckets removed.
    std::size_t evictIdle();
    [[nodiscard]] std::size_t size() const;
private:
    LockedUnorderedMap<std::string, Bucket> buckets;
    std::chrono::milliseconds expiry;
    AsyncTimer evictor;
};

} // namespace toolgate

#endif // TOOLGATE_MEMORY_STORE_H
