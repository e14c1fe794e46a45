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
#ifndef TOOLGATE_CIRCUIT_BREAKER_H
#define TOOLGATE_CIRCUIT_BREAKER_H

#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include "common/Error.hpp"
#include "common/Metrics.hpp"

namespace toolgate {

struct CircuitBreakerConfig {
    CircuitBreakerConfig(std::string n, int failures, std::chrono::microseconds t, int halfOpen);
    // 5 failures, 30s open timeout, 3 half-open trials.
    static CircuitBreakerConfig defaults(const std::string& name);

    std::string name;
    int maxFailures;
    std::chrono::microseconds timeout;
    int maxHalfOpenRequests;
};

class CircuitBreaker {
public:
    enum class State : char {
        Open,
        Closed,
        HalfOpen
    };
    explicit CircuitBreaker(CircuitBreakerConfig c, MetricsSink& metrics = noopMetrics());
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Runs op if the breaker admits it and records the outcome. op must return
    // std::expected<T, Error>; its error is returned unchanged. A rejected
    // call never runs op and yields a CircuitBreakerError.
    template<typename F>
    auto call(F&& op) -> std::invoke_result_t<F&>;

    void recordSuccess();
    void recordFailure(const Error& error);

    // Applies the lazy Open -> HalfOpen transition.
    [[nodiscard]] bool open();
    [[nodiscard]] State state();
    [[nodiscard]] int failures() const;
    [[nodiscard]] const std::string& name() const;
    [[nodiscard]] const CircuitBreakerConfig& config() const;
    void reset();
    [[nodiscard]] std::string toString();
private:
    struct Admission {
        uint64_t generation;
        bool halfOpenTrial;
    };
    std::expected<Admission, Error> admit();
    void onSuccess(const std::optional<Admission>& admission);
    void onFailure(const std::optional<Admission>& admission);
    void releaseTrial(const std::optional<Admission>& admission);
    bool timeoutElapsed() const;
    void transitionTo(State next);

    CircuitBreakerConfig cfg;
    MetricsSink& sink;
    mutable std::mutex m;
    State current;
    int failureCount;
    int halfOpenSuccesses;
    int trialsInFlight;
    uint64_t generation;
    std::optional<std::chrono::steady_clock::time_point> lastFailureTime;
};

std::string toString(const CircuitBreaker::State& state);

template<typename F>
auto CircuitBreaker::call(F&& op) -> std::invoke_result_t<F&> {
    auto admission = admit();
    if (!admission.has_value()) {
        return std::unexpected {admission.error()};
    }
    try {
        auto result = op();
        if (result.has_value()) {
            onSuccess(admission.value());
        } else {
            onFailure(admission.value());
        }
        return result;
    } catch (...) {
        onFailure(admission.value());
        throw;
    }
}

} // namespace toolgate

#endif // TOOLGATE_CIRCUIT_BREAKER_H
