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
#ifndef TOOLGATE_JITTER_H
#define TOOLGATE_JITTER_H

#include <chrono>

namespace toolgate {

// Perturbs a delay by a uniform offset in [-fraction, +fraction] of itself,
// never going below zero. Safe to share between threads.
class Jitter {
public:
    explicit Jitter(double fraction = 0.25);
    [[nodiscard]] std::chrono::microseconds apply(const std::chrono::microseconds v) const;
    [[nodiscard]] double fraction() const;
private:
    double spread;
};

} // namespace toolgate

#endif // TOOLGATE_JITTER_H
