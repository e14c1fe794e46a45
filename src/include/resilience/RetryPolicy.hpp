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
#ifndef TOOLGATE_RETRY_POLICY_H
#define TOOLGATE_RETRY_POLICY_H

#include <chrono>
#include <expected>
#include <string>
#include "common/Error.hpp"

namespace toolgate {

struct RetryPolicy {
    enum class Strategy : char {
        Exponential,
        Linear,
        Constant,
        None
    };

    RetryPolicy(
        int attempts,
        std::chrono::microseconds initial,
        std::chrono::microseconds max,
        double mult,
        bool jitterEnabled,
        Strategy s
    );
    // 3 attempts, 1s initial, 30s max, x2, jitter, exponential.
    static RetryPolicy defaults();

    int maxAttempts;
    std::chrono::microseconds initialDelay;
    // Zero disables the cap for linear and exponential backoff.
    std::chrono::microseconds maxDelay;
    double multiplier;
    bool jitter;
    Strategy strategy;
};

// An empty name selects exponential.
std::expected<RetryPolicy::Strategy, Error> parseStrategy(const std::string& name);
std::string toString(const RetryPolicy::Strategy& strategy);

} // namespace toolgate

#endif // TOOLGATE_RETRY_POLICY_H
