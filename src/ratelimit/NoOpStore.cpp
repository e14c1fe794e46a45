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
#include "ratelimit/NoOpStore.hpp"

namespace toolgate {

std::expected<int, Error> NoOpStore::increment(const std::string& /*key*/, std::chrono::milliseconds /*window*/) {
    return 1;
}

std::expected<int, Error> NoOpStore::get(const std::string& /*key*/) const {
    return 0;
}

std::expected<std::monostate, Error> NoOpStore::reset(const std::string& /*key*/) {
    return {};
}

std::expected<std::monostate, Error> NoOpStore::erase(const std::string& /*key*/) {
    return {};
}

} // namespace toolgate
