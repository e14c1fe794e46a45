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
#ifndef TOOLGATE_UTIL_H
#define TOOLGATE_UTIL_H

#include <random>
#include <array>
#include <algorithm>
#include <functional>
#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <expected>
#include "common/Error.hpp"

namespace toolgate {

template <typename T = std::mt19937>
auto random_generator() -> T {
    auto constexpr seed_bytes = sizeof(typename T::result_type) * T::state_size;
    auto constexpr seed_len = seed_bytes / sizeof(std::seed_seq::result_type);
    auto seed = std::array<std::seed_seq::result_type, seed_len>();
    auto dev = std::random_device();
    std::generate_n(begin(seed), seed_len, std::ref(dev));
    auto seed_seq = std::seed_seq(begin(seed), end(seed));
    return T{seed_seq};
}

using UUIDV7 = std::array<uint8_t, 16>;

// Generate UUID version 7 (time-ordered, RFC 9562)
UUIDV7 generate_uuid_v7();

// Canonical 8-4-4-4-12 hex form
std::string uuid_v7_to_string(const UUIDV7& uuid);

// Fresh request id for log correlation
std::string newRequestId();

// Parses "100us", "250ms", "30s", "1m", "2h" or a bare integer (milliseconds).
std::expected<std::chrono::microseconds, Error> parseDuration(std::string_view text);

// Shortest exact rendering in the units parseDuration accepts.
std::string formatDuration(std::chrono::microseconds d);

} // namespace toolgate

#endif // TOOLGATE_UTIL_H
