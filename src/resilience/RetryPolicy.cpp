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
#include "resilience/RetryPolicy.hpp"
#include "common/Error.hpp"
#include <stdexcept>
#include <chrono>
#include <string>
#include <utility>

namespace toolgate {

RetryPolicy::RetryPolicy(
    int attempts,
    std::chrono::microseconds initial,
    std::chrono::microseconds max,
    double mult,
    bool jitterEnabled,
    Strategy s)
    : maxAttempts(attempts),
      initialDelay(initial),
      maxDelay(max),
      multiplier(mult),
      jitter(jitterEnabled),
      strategy(s) {
    if (attempts < 1) {
        throw std::invalid_argument("max_attempts must be at least 1");
    }
    if (initial < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("initial_delay cannot be negative");
    }
    if (max < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("max_delay cannot be negative");
    }
    if (max > std::chrono::microseconds::zero() && initial > max) {
        throw std::invalid_argument("initial_delay cannot be greater than max_delay");
    }
    if (mult <= 0) {
        throw std::invalid_argument("multiplier must be positive");
    }
}

RetryPolicy RetryPolicy::defaults() {
    return RetryPolicy {3, std::chrono::seconds {1}, std::chrono::seconds {30}, 2.0, true, Strategy::Exponential};
}

std::expected<RetryPolicy::Strategy, Error> parseStrategy(const std::string& name) {
    if (name.empty() || name == "exponential") {
        return RetryPolicy::Strategy::Exponential;
    }
    if (name == "linear") {
        return RetryPolicy::Strategy::Linear;
    }
    if (name == "constant") {
        return RetryPolicy::Strategy::Constant;
    }
    if (name == "none") {
        return RetryPolicy::Strategy::None;
    }
    return std::unexpected {Error {ErrorCode::InvalidArg,
        "invalid strategy: " + name + " (must be exponential, linear, constant, or none)"}};
}

std::string toString(const RetryPolicy::Strategy& strategy) {
    switch (strategy) {
        case RetryPolicy::Strategy::Exponential: return "exponential";
        case RetryPolicy::Strategy::Linear: return "linear";
        case RetryPolicy::Strategy::Constant: return "constant";
        case RetryPolicy::Strategy::None: return "none";
    }
    std::unreachable();
}

} // namespace toolgate
