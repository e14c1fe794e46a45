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
#include "resilience/Jitter.hpp"
#include "common/Util.hpp"
#include <stdexcept>
#include <random>
#include <chrono>

namespace toolgate {

Jitter::Jitter(double fraction) : spread {fraction} {
    if (fraction < 0.0 || fraction > 1.0) {
        throw std::invalid_argument("Jitter fraction must be within [0, 1]");
    }
}

std::chrono::microseconds Jitter::apply(const std::chrono::microseconds v) const {
    if (v < std::chrono::microseconds(0)) {
        throw std::invalid_argument("Negative duration is not supported");
    }
    thread_local auto rng = random_generator<>();
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    const auto base = static_cast<double>(v.count());
    const auto jittered = base + dist(rng) * spread * base;
    if (jittered <= 0.0) {
        return std::chrono::microseconds::zero();
    }
    return std::chrono::microseconds(static_cast<std::chrono::microseconds::rep>(jittered));
}

double Jitter::fraction() const {
    return spread;
}

} // namespace toolgate
