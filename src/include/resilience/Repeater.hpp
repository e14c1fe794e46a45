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
#ifndef TOOLGATE_REPEATER_H
#define TOOLGATE_REPEATER_H

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include "common/Context.hpp"
#include "common/Error.hpp"
#include "resilience/BackoffStrategy.hpp"
#include "resilience/RetryPolicy.hpp"

namespace toolgate {

using RetryCallback = std::function<void(int attempt, const Error& error, std::chrono::microseconds delay)>;
using RetryPredicate = std::function<bool(const Error& error)>;

// Per-invocation hooks for Repeater.
struct RetryOptions {
    RetryCallback onRetry {};
    // Replaces the executor's own predicate for this call only.
    RetryPredicate retryIf {};
};

// Retry executor. Configuration is fixed at construction; everything that
// varies per invocation (attempt counter, delays, observers) lives on the
// caller's stack, so one instance can serve concurrent calls.
class Repeater {
public:
    using OnRetry = RetryCallback;
    using RetryIf = RetryPredicate;
    using Options = RetryOptions;

    explicit Repeater(const RetryPolicy p, RetryIf r = {});

    std::expected<std::monostate, Error> attempt(
        const Context& ctx,
        const std::function<std::expected<std::monostate, Error>(int)>& fn,
        const Options& options = {}) const;

    // fn(attempt) must return std::expected<T, Error>.
    template<typename F>
    auto attemptWithData(const Context& ctx, F&& fn, const Options& options = {}) const
        -> std::invoke_result_t<F&, int>;

    [[nodiscard]] const RetryPolicy& policy() const;
    [[nodiscard]] const BackoffStrategy& backoff() const;
private:
    static Error interrupted(const Context& ctx);
    RetryPolicy retryPolicy;
    std::shared_ptr<const BackoffStrategy> strategy;
    RetryIf retryIf;
};

// Predicate consulting the per-tool retriable error table. Cancellation is
// never retried.
Repeater::RetryIf retriableFor(const std::string& tool);

template<typename F>
auto Repeater::attemptWithData(const Context& ctx, F&& fn, const Options& options) const
    -> std::invoke_result_t<F&, int> {
    using Result = std::invoke_result_t<F&, int>;
    const RetryIf& shouldRetry = options.retryIf ? options.retryIf : retryIf;
    std::optional<Error> lastError;
    std::chrono::microseconds lastDelay {0};
    std::chrono::microseconds totalDelay {0};

    for (int attempt = 0; attempt < retryPolicy.maxAttempts; ++attempt) {
        if (ctx.done()) {
            return std::unexpected {interrupted(ctx)};
        }
        Result result = fn(attempt);
        if (result.has_value()) {
            return result;
        }
        lastError = result.error();
        if (shouldRetry && !shouldRetry(lastError.value())) {
            return result;
        }
        if (attempt == retryPolicy.maxAttempts - 1) {
            break;
        }
        const auto delay = strategy->nextDelay(attempt);
        lastDelay = delay;
        totalDelay += delay;
        if (options.onRetry) {
            options.onRetry(attempt, lastError.value(), delay);
        }
        if (delay > std::chrono::microseconds::zero() && !ctx.sleepFor(delay)) {
            return std::unexpected {interrupted(ctx)};
        }
    }

    return std::unexpected {Error {RetryError {
        std::make_shared<const Error>(std::move(lastError.value())),
        static_cast<unsigned>(retryPolicy.maxAttempts),
        lastDelay,
        totalDelay
    }}};
}

} // namespace toolgate

#endif // TOOLGATE_REPEATER_H
