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
#ifndef TOOLGATE_COUNTER_STORE_H
#define TOOLGATE_COUNTER_STORE_H

#include <chrono>
#include <expected>
#include <string>
#include <variant>
#include "common/Error.hpp"

namespace toolgate {

// Fixed-window request counters keyed by rate-limit key.
class CounterStore {
public:
    virtual ~CounterStore() = default;

    // Starts a fresh window (count 1) when the key is absent or its window has
    // elapsed, otherwise increments. Returns the count after the update.
    virtual std::expected<int, Error> increment(const std::string& key, std::chrono::milliseconds window) = 0;
    // Current count without modifying it; an elapsed window reads as 0.
    virtual std::expected<int, Error> get(const std::string& key) const = 0;
    virtual std::expected<std::monostate, Error> reset(const std::string& key) = 0;
    virtual std::expected<std::monostate, Error> erase(const std::string& key) = 0;
    // Releases background resources. Idempotent.
    virtual void close() {}
};

} // namespace toolgate

#endif // TOOLGATE_COUNTER_STORE_H
