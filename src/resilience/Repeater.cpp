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
#include "resilience/Repeater.hpp"
#include "resilience/BackoffStrategy.hpp"
#include "resilience/RetryPolicy.hpp"
#include "common/Context.hpp"
#include "common/Error.hpp"
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace toolgate {

Repeater::Repeater(const RetryPolicy p, RetryIf r)
    : retryPolicy {p},
      strategy {makeBackoffStrategy(p)},
      retryIf {std::move(r)} {}

std::expected<std::monostate, Error> Repeater::attempt(
    const Context& ctx,
    const std::function<std::expected<std::monostate, Error>(int)>& fn,
    const Options& options) const {
    return attemptWithData(ctx, fn, options);
}

const RetryPolicy& Repeater::policy() const {
    return retryPolicy;
}

const BackoffStrategy& Repeater::backoff() const {
    return *strategy;
}

Error Repeater::interrupted(const Context& ctx) {
    auto cause = ctx.err().value_or(Error {ErrorCode::Cancelled, "context cancelled"});
    return Error {cause.code, "context cancelled during retry: " + cause.what};
}

Repeater::RetryIf retriableFor(const std::string& tool) {
    return [tool](const Error& error) {
        if (error.is(ErrorCode::Cancelled)) {
            return false;
        }
        return isRetriable(tool, error.code);
    };
}

} // namespace toolgate
