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
#include "ratelimit/MemoryStore.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstddef>
#include <string>

namespace toolgate {

MemoryStore::MemoryStore()
    : MemoryStore(std::chrono::minutes {5}, std::chrono::minutes {10}) {}

MemoryStore::MemoryStore(std::chrono::milliseconds cleanupInterval, std::chrono::milliseconds idleExpiry)
    : buckets {}, expiry {idleExpiry} {
    evictor.start(cleanupInterval, [this] { evictIdle(); });
}

MemoryStore::~MemoryStore() {
    stop();
}

std::expected<int, Error> MemoryStore::increment(const std::string& key, std::chrono::milliseconds window) {
    const auto now = std::chrono::steady_clock::now();
    return buckets.upsert(key, [&now, &window](Bucket& b, bool inserted) {
        if (inserted || now - b.windowStart >= window) {
            b = Bucket {1, now, now, window};
        } else {
            ++b.count;
            b.lastUpdate = now;
            b.window = window;
        }
        return b.count;
    });
}

std::expected<int, Error> MemoryStore::get(const std::string& key) const {
    auto b = buckets.get(key);
    if (!b.has_value()) {
        return 0;
    }
    if (std::chrono::steady_clock::now() - b->windowStart >= b->window) {
        return 0;
    }
    return b->count;
}

std::expected<std::monostate, Error> MemoryStore::reset(const std::string& key) {
    buckets.erase(key);
    return {};
}

std::expected<std::monostate, Error> MemoryStore::erase(const std::string& key) {
    buckets.erase(key);
    return {};
}

void MemoryStore::close() {
    stop();
}

void MemoryStore::stop() {
    evictor.stop();
}

std::size_t MemoryStore::evictIdle() {
    const auto cutoff = std::chrono::steady_clock::now() - expiry;
    auto removed = buckets.eraseIf([&cutoff](const std::string&, const Bucket& b) {
        return b.lastUpdate < cutoff;
    });
    if (removed > 0) {
        spdlog::debug("MemoryStore evicted {} idle buckets", removed);
    }
    return removed;
}

std::size_t MemoryStore::size() const {
    return buckets.size();
}

} // namespace toolgate
