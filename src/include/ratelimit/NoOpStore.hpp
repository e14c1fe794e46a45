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
#ifndef TOOLGATE_NOOP_STORE_H
#define TOOLGATE_NOOP_STORE_H

#include "ratelimit/CounterStore.hpp"

namespace toolgate {

// Admits everything: every increment reports a first request.
class NoOpStore final : public CounterStore {
public:
    std::expected<int, Error> increment(const std::string& key, std::chrono::milliseconds window) override;
    std::expected<int, Error> get(const std::string& key) const override;
    std::expected<std::monostate, Error> reset(const std::string& key) override;
    std::expected<std::monostate, Error> erase(const std::string& key) override;
};

} // namespace toolgate

#endif // TOOLGATE_NOOP_STORE_H
