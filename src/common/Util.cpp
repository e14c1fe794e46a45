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
#include "common/Util.hpp"
#include "common/Error.hpp"
#include <algorithm>
#include <random>
#include <string_view>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <fmt/format.h>

namespace toolgate {

UUIDV7 generate_uuid_v7() {
    thread_local auto rng = random_generator<>();
    auto dist = std::uniform_int_distribution<unsigned int>{0, 255};

    UUIDV7 uuid{};

    // Get current time in milliseconds since Unix epoch
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    auto timestamp = static_cast<uint64_t>(ms);

    // Fill the first 48 bits (6 bytes) with timestamp
    uuid[0] = static_cast<uint8_t>((timestamp >> 40) & 0xFF);
    uuid[1] = static_cast<uint8_t>((timestamp >> 32) & 0xFF);
    uuid[2] = static_cast<uint8_t>((timestamp >> 24) & 0xFF);
    uuid[3] = static_cast<uint8_t>((timestamp >> 16) & 0xFF);
    uuid[4] = static_cast<uint8_t>((timestamp >> 8) & 0xFF);
    uuid[5] = static_cast<uint8_t>(timestamp & 0xFF);

    // Fill the remaining bytes with random data
    for (size_t i = 6; i < 16; ++i) {
        uuid[i] = static_cast<uint8_t>(dist(rng));
    }

    // Set version 7 (bits 12-15 of time_hi_and_version)
    uuid[6] = (uuid[6] & 0x0F) | 0x70;

    // Set variant bits (bits 6-7 of clock_seq_hi_and_reserved)
    uuid[8] = (uuid[8] & 0x3F) | 0x80;

    return uuid;
}

std::string uuid_v7_to_string(const UUIDV7& uuid) {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out += fmt::format("{:02x}", uuid[i]);
    }
    return out;
}

std::string newRequestId() {
    return uuid_v7_to_string(generate_uuid_v7());
}

std::expected<std::chrono::microseconds, Error> parseDuration(std::string_view text) {
    if (text.empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "empty duration"}};
    }
    int64_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr == first) {
        return std::unexpected {Error {ErrorCode::InvalidArg, fmt::format("invalid duration: {}", text)}};
    }
    if (value < 0) {
        return std::unexpected {Error {ErrorCode::InvalidArg, fmt::format("negative duration: {}", text)}};
    }
    const std::string_view unit {ptr, static_cast<size_t>(last - ptr)};
    std::chrono::microseconds scale {0};
    if (unit.empty() || unit == "ms") {
        scale = std::chrono::milliseconds {1};
    } else if (unit == "us") {
        scale = std::chrono::microseconds {1};
    } else if (unit == "s") {
        scale = std::chrono::seconds {1};
    } else if (unit == "m") {
        scale = std::chrono::minutes {1};
    } else if (unit == "h") {
        scale = std::chrono::hours {1};
    } else {
        return std::unexpected {Error {ErrorCode::InvalidArg, fmt::format("invalid duration unit '{}' in {}", unit, text)}};
    }
    if (value > std::chrono::microseconds::max().count() / scale.count()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, fmt::format("duration out of range: {}", text)}};
    }
    return scale * value;
}

std::string formatDuration(std::chrono::microseconds d) {
    using namespace std::chrono;
    const auto count = d.count();
    if (count == 0) {
        return "0s";
    }
    if (count % duration_cast<microseconds>(hours {1}).count() == 0) {
        return fmt::format("{}h", duration_cast<hours>(d).count());
    }
    if (count % duration_cast<microseconds>(minutes {1}).count() == 0) {
        return fmt::format("{}m", duration_cast<minutes>(d).count());
    }
    if (count % duration_cast<microseconds>(seconds {1}).count() == 0) {
        return fmt::format("{}s", duration_cast<seconds>(d).count());
    }
    if (count % duration_cast<microseconds>(milliseconds {1}).count() == 0) {
        return fmt::format("{}ms", duration_cast<milliseconds>(d).count());
    }
    return fmt::format("{}us", count);
}

} // namespace toolgate
