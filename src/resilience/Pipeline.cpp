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
#include "resilience/Pipeline.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace toolgate {

Pipeline::Pipeline(
    std::string tool,
    std::shared_ptr<CircuitBreaker> breaker,
    std::shared_ptr<RateLimiter> limiter,
    std::optional<InstrumentedRepeater> repeater,
    std::optional<std::chrono::microseconds> timeout,
    MetricsSink& metrics)
    : toolName {std::move(tool)},
      circuit {std::move(breaker)},
      rateLimiter {std::move(limiter)},
      retry {std::move(repeater)},
      trialTimeout {timeout},
      sink {metrics} {
    if (!circuit) {
        throw std::invalid_argument("Circuit breaker must not be null.");
    }
    if (trialTimeout.has_value() && trialTimeout.value() <= std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Timeout must be positive.");
    }
}

std::optional<Error> Pipeline::checkRateLimit(const std::string& clientId) const {
    if (!rateLimiter) {
        return std::nullopt;
    }
    const auto key = rateLimiter->generateKey(toolName, clientId);
    auto allowed = rateLimiter->allow(key);
    if (!allowed.has_value()) {
        spdlog::warn("Rate limit check failed for {}, allowing request: {}", key, allowed.error().what);
        return std::nullopt;
    }
    if (allowed.value()) {
        return std::nullopt;
    }
    auto limit = rateLimiter->config().limit;
    auto window = rateLimiter->config().window;
    if (auto stats = rateLimiter->stats(key); stats.has_value()) {
        limit = stats->limit;
        window = stats->window;
    }
    return Error {RateLimitError {key, limit, window, window}};
}

void Pipeline::record(const Error* error, std::chrono::steady_clock::time_point started) const {
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    if (error == nullptr) {
        sink.toolCall(toolName, "success", elapsed);
        return;
    }
    sink.toolCall(toolName, category(error->code), elapsed);
    spdlog::debug("{} failed after {}us: {}", toolName, elapsed.count(), error->what);
}

const std::string& Pipeline::tool() const {
    return toolName;
}

const std::shared_ptr<CircuitBreaker>& Pipeline::breaker() const {
    return circuit;
}

const std::shared_ptr<RateLimiter>& Pipeline::limiter() const {
    return rateLimiter;
}

bool Pipeline::retries() const {
    return retry.has_value();
}

std::optional<std::chrono::microseconds> Pipeline::timeout() const {
    return trialTimeout;
}

} // namespace toolgate
