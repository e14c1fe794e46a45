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
#ifndef TOOLGATE_INSTRUMENTED_REPEATER_H
#define TOOLGATE_INSTRUMENTED_REPEATER_H

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <spdlog/spdlog.h>
#include "common/Context.hpp"
#include "common/Error.hpp"
#include "common/Metrics.hpp"
#include "resilience/Repeater.hpp"

namespace toolgate {

// Binds a shared retry executor to one tool name. Logging and metrics are
// installed per call, the executor itself is never mutated.
class InstrumentedRepeater {
public:
    InstrumentedRepeater(std::string tool, std::shared_ptr<const Repeater> r, MetricsSink& metrics = noopMetrics());

    template<typename F>
    auto attemptWithData(const Context& ctx, F&& fn) const -> std::invoke_result_t<F&, int>;

    std::expected<std::monostate, Error> attempt(
        const Context& ctx,
        const std::function<std::expected<std::monostate, Error>(int)>& fn) const;

    [[nodiscard]] const std::string& tool() const;
    [[nodiscard]] const Repeater& repeater() const;
private:
    void finished(int attempts, const Error* error) const;
    std::string toolName;
    std::shared_ptr<const Repeater> executor;
    MetricsSink& sink;
};

template<typename F>
auto InstrumentedRepeater::attemptWithData(const Context& ctx, F&& fn) const -> std::invoke_result_t<F&, int> {
    int attempts = 0;
    Repeater::Options options;
    options.onRetry = [this](int attempt, const Error& error, std::chrono::microseconds delay) {
        spdlog::debug("Retrying {} after attempt {} failed: {} (next delay {}us)", toolName, attempt + 1, error.what, delay.count());
        sink.retryAttempt(toolName, static_cast<unsigned>(attempt + 1), delay);
    };
    auto counted = [&attempts, &fn](int attempt) {
        attempts = attempt + 1;
        return fn(attempt);
    };
    auto result = executor->attemptWithData(ctx, counted, options);
    finished(attempts, result.has_value() ? nullptr : &result.error());
    return result;
}

} // namespace toolgate

#endif // TOOLGATE_INSTRUMENTED_REPEATER_H
