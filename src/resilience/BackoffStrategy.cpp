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
#include "resilience/BackoffStrategy.hpp"
#include "resilience/RetryPolicy.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace toolgate {

std::chrono::microseconds NoBackoff::nextDelay(int /*attempt*/) const {
    return std::chrono::microseconds::zero();
}

std::string NoBackoff::name() const {
    return "none";
}

ConstantBackoff::ConstantBackoff(std::chrono::microseconds d)
    : delay {d} {}

std::chrono::microseconds ConstantBackoff::nextDelay(int /*attempt*/) const {
    return delay;
}

std::string ConstantBackoff::name() const {
    return "constant";
}

LinearBackoff::LinearBackoff(std::chrono::microseconds initial, std::chrono::microseconds max)
    : initialDelay {initial}, maxDelay {max} {}

std::chrono::microseconds LinearBackoff::nextDelay(int attempt) const {
    auto delay = initialDelay * std::max(attempt, 0);
    if (maxDelay > std::chrono::microseconds::zero() && delay > maxDelay) {
        delay = maxDelay;
    }
    return delay;
}

std::string LinearBackoff::name() const {
    return "linear";
}

ExponentialBackoff::ExponentialBackoff(std::chrono::microseconds initial, std::chrono::microseconds max, double multiplier, bool j)
    : initialDelay {initial},
      maxDelay {max},
      factor {multiplier},
      jitterEnabled {j},
      jitter {0.25} {}

std::chrono::microseconds ExponentialBackoff::nextDelay(int attempt) const {
    const auto raw = static_cast<double>(initialDelay.count()) * std::pow(factor, std::max(attempt, 0));
    constexpr auto limit = static_cast<double>(std::numeric_limits<std::chrono::microseconds::rep>::max() / 2);
    auto delay = std::chrono::microseconds(static_cast<std::chrono::microseconds::rep>(std::min(raw, limit)));
    if (maxDelay > std::chrono::microseconds::zero() && delay > maxDelay) {
        delay = maxDelay;
    }
    spdlog::trace("ExponentialBackoff: Attempt {}, delay: {}us, maxDelay: {}us", attempt, delay.count(), maxDelay.count());
    if (jitterEnabled) {
        return jitter.apply(delay);
    }
    return delay;
}

std::string ExponentialBackoff::name() const {
    return "exponential";
}

std::unique_ptr<BackoffStrategy> makeBackoffStrategy(const RetryPolicy& policy) {
    switch (policy.strategy) {
        case RetryPolicy::Strategy::Exponential:
            return std::make_unique<ExponentialBackoff>(policy.initialDelay, policy.maxDelay, policy.multiplier, policy.jitter);
        case RetryPolicy::Strategy::Linear:
            return std::make_unique<LinearBackoff>(policy.initialDelay, policy.maxDelay);
        case RetryPolicy::Strategy::Constant:
            return std::make_unique<ConstantBackoff>(policy.initialDelay);
        case RetryPolicy::Strategy::None:
            return std::make_unique<NoBackoff>();
    }
    std::unreachable();
}

} // namespace toolgate
