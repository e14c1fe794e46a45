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
#ifndef TOOLGATE_PIPELINE_H
#define TOOLGATE_PIPELINE_H

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include "common/Context.hpp"
#include "common/Error.hpp"
#include "common/Metrics.hpp"
#include "ratelimit/RateLimiter.hpp"
#include "resilience/CircuitBreaker.hpp"
#include "resilience/InstrumentedRepeater.hpp"

namespace toolgate {

// Resilience chain for one tool: rate limit, then circuit breaker around an
// optionally retried handler. The whole retried sequence is a single breaker
// trial and the optional timeout bounds that trial, not each attempt.
class Pipeline {
public:
    Pipeline(
        std::string tool,
        std::shared_ptr<CircuitBreaker> breaker,
        std::shared_ptr<RateLimiter> limiter = nullptr,
        std::optional<InstrumentedRepeater> repeater = std::nullopt,
        std::optional<std::chrono::microseconds> timeout = std::nullopt,
        MetricsSink& metrics = noopMetrics());

    // handler(ctx, attempt) must return std::expected<T, Error>.
    template<typename F>
    auto execute(const Context& ctx, const std::string& clientId, F&& handler) const
        -> std::invoke_result_t<F&, const Context&, int>;

    [[nodiscard]] const std::string& tool() const;
    [[nodiscard]] const std::shared_ptr<CircuitBreaker>& breaker() const;
    [[nodiscard]] const std::shared_ptr<RateLimiter>& limiter() const;
    [[nodiscard]] bool retries() const;
    [[nodiscard]] std::optional<std::chrono::microseconds> timeout() const;
private:
    // Holds the active-requests gauge up while one execute runs, including
    // when the handler throws.
    class ActiveRequest {
    public:
        ActiveRequest(MetricsSink& s, const std::string& t) : sink {s}, tool {t} {
            sink.activeRequests(tool, 1);
        }
        ~ActiveRequest() {
            sink.activeRequests(tool, -1);
        }
        ActiveRequest(const ActiveRequest&) = delete;
        ActiveRequest& operator=(const ActiveRequest&) = delete;
    private:
        MetricsSink& sink;
        const std::string& tool;
    };

    // Empty when the request may proceed, including when the store failed.
    std::optional<Error> checkRateLimit(const std::string& clientId) const;
    void record(const Error* error, std::chrono::steady_clock::time_point started) const;

    std::string toolName;
    std::shared_ptr<CircuitBreaker> circuit;
    std::shared_ptr<RateLimiter> rateLimiter;
    std::optional<InstrumentedRepeater> retry;
    std::optional<std::chrono::microseconds> trialTimeout;
    MetricsSink& sink;
};

template<typename F>
auto Pipeline::execute(const Context& ctx, const std::string& clientId, F&& handler) const
    -> std::invoke_result_t<F&, const Context&, int> {
    using Result = std::invoke_result_t<F&, const Context&, int>;
    const auto started = std::chrono::steady_clock::now();
    const ActiveRequest active {sink, toolName};

    if (auto rejected = checkRateLimit(clientId); rejected.has_value()) {
        Result result = std::unexpected {std::move(rejected.value())};
        record(&result.error(), started);
        return result;
    }

    Result result = circuit->call([this, &ctx, &handler]() -> Result {
        const Context trial = trialTimeout.has_value() ? ctx.withTimeout(trialTimeout.value()) : ctx;
        if (retry.has_value()) {
            return retry->attemptWithData(trial, [&trial, &handler](int attempt) -> Result {
                return handler(trial, attempt);
            });
        }
        return handler(trial, 0);
    });
    record(result.has_value() ? nullptr : &result.error(), started);
    return result;
}

} // namespace toolgate

#endif // TOOLGATE_PIPELINE_H
