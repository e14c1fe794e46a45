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
#include "resilience/CircuitBreaker.hpp"
#include "common/Error.hpp"
#include "common/Metrics.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace toolgate {

CircuitBreakerConfig::CircuitBreakerConfig(std::string n, int failures, std::chrono::microseconds t, int halfOpen)
    : name {std::move(n)},
      maxFailures {failures},
      timeout {t},
      maxHalfOpenRequests {halfOpen} {
    if (name.empty()) {
        throw std::invalid_argument("name cannot be empty");
    }
    if (failures <= 0) {
        throw std::invalid_argument("max_failures must be positive");
    }
    if (t <= std::chrono::microseconds::zero()) {
        throw std::invalid_argument("timeout must be positive");
    }
    if (halfOpen <= 0) {
        throw std::invalid_argument("max_half_open_requests must be positive");
    }
}

CircuitBreakerConfig CircuitBreakerConfig::defaults(const std::string& name) {
    return CircuitBreakerConfig {name, 5, std::chrono::seconds {30}, 3};
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig c, MetricsSink& metrics)
    : cfg {std::move(c)},
      sink {metrics},
      current {State::Closed},
      failureCount {0},
      halfOpenSuccesses {0},
      trialsInFlight {0},
      generation {0},
      lastFailureTime {std::nullopt} {}

std::expected<CircuitBreaker::Admission, Error> CircuitBreaker::admit() {
    const std::lock_guard lock {m};
    switch (current) {
        case State::Open:
            if (!timeoutElapsed()) {
                break;
            }
            transitionTo(State::HalfOpen);
            [[fallthrough]];
        case State::HalfOpen:
            if (halfOpenSuccesses + trialsInFlight >= cfg.maxHalfOpenRequests) {
                break;
            }
            ++trialsInFlight;
            sink.circuitAllowed(cfg.name);
            return Admission {generation, true};
        case State::Closed:
            sink.circuitAllowed(cfg.name);
            return Admission {generation, false};
    }
    sink.circuitRejected(cfg.name);
    return std::unexpected {Error {CircuitBreakerError {
        cfg.name,
        "request rejected",
        std::make_shared<const Error>(ErrorCode::CircuitOpen, "circuit breaker is open")
    }}};
}

void CircuitBreaker::releaseTrial(const std::optional<Admission>& admission) {
    if (admission.has_value() && admission->halfOpenTrial && admission->generation == generation && trialsInFlight > 0) {
        --trialsInFlight;
    }
}

void CircuitBreaker::onSuccess(const std::optional<Admission>& admission) {
    const std::lock_guard lock {m};
    releaseTrial(admission);
    switch (current) {
        case State::Closed:
            failureCount = 0;
            break;
        case State::HalfOpen:
            ++halfOpenSuccesses;
            if (halfOpenSuccesses >= cfg.maxHalfOpenRequests) {
                transitionTo(State::Closed);
            }
            break;
        case State::Open:
            transitionTo(State::Closed);
            break;
    }
}

void CircuitBreaker::onFailure(const std::optional<Admission>& admission) {
    const std::lock_guard lock {m};
    releaseTrial(admission);
    lastFailureTime = std::chrono::steady_clock::now();
    switch (current) {
        case State::Closed:
            ++failureCount;
            if (failureCount >= cfg.maxFailures) {
                transitionTo(State::Open);
            }
            break;
        case State::HalfOpen:
            transitionTo(State::Open);
            break;
        case State::Open:
            break;
    }
}

void CircuitBreaker::recordSuccess() {
    onSuccess(std::nullopt);
}

void CircuitBreaker::recordFailure(const Error& error) {
    spdlog::debug("Circuit breaker '{}' recording failure: {}", cfg.name, error.what);
    onFailure(std::nullopt);
}

bool CircuitBreaker::timeoutElapsed() const {
    if (!lastFailureTime.has_value()) {
        return true;
    }
    return std::chrono::steady_clock::now() - lastFailureTime.value() >= cfg.timeout;
}

void CircuitBreaker::transitionTo(State next) {
    if (current == next) {
        return;
    }
    const auto from = current;
    current = next;
    failureCount = 0;
    halfOpenSuccesses = 0;
    trialsInFlight = 0;
    ++generation;
    if (next == State::Open) {
        spdlog::warn("Circuit breaker '{}' transitioning {} -> {}", cfg.name, toolgate::toString(from), toolgate::toString(next));
    } else {
        spdlog::info("Circuit breaker '{}' transitioning {} -> {}", cfg.name, toolgate::toString(from), toolgate::toString(next));
    }
    sink.circuitTransition(cfg.name, toolgate::toString(from), toolgate::toString(next));
}

bool CircuitBreaker::open() {
    const std::lock_guard lock {m};
    if (current == State::Open && timeoutElapsed()) {
        transitionTo(State::HalfOpen);
    }
    return current == State::Open;
}

CircuitBreaker::State CircuitBreaker::state() {
    const std::lock_guard lock {m};
    if (current == State::Open && timeoutElapsed()) {
        transitionTo(State::HalfOpen);
    }
    return current;
}

int CircuitBreaker::failures() const {
    const std::lock_guard lock {m};
    return failureCount;
}

const std::string& CircuitBreaker::name() const {
    return cfg.name;
}

const CircuitBreakerConfig& CircuitBreaker::config() const {
    return cfg;
}

void CircuitBreaker::reset() {
    const std::lock_guard lock {m};
    transitionTo(State::Closed);
    failureCount = 0;
    halfOpenSuccesses = 0;
    trialsInFlight = 0;
    lastFailureTime.reset();
}

std::string CircuitBreaker::toString() {
    const std::lock_guard lock {m};
    std::string lastFailure {"never"};
    if (lastFailureTime.has_value()) {
        const auto ago = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - lastFailureTime.value());
        lastFailure = fmt::format("{}ms ago", ago.count());
    }
    return fmt::format("CircuitBreaker{{name={}, state={}, failures={}, lastFailure={}}}",
        cfg.name, toolgate::toString(current), failureCount, lastFailure);
}

std::string toString(const CircuitBreaker::State& state) {
    switch (state) {
        case CircuitBreaker::State::Closed: return "closed";
        case CircuitBreaker::State::Open: return "open";
        case CircuitBreaker::State::HalfOpen: return "half-open";
    }
    std::unreachable();
}

} // namespace toolgate
