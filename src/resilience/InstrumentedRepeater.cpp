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
#include "resilience/InstrumentedRepeater.hpp"
#include "resilience/Repeater.hpp"
#include "common/Error.hpp"
#include "common/Metrics.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace toolgate {

InstrumentedRepeater::InstrumentedRepeater(std::string tool, std::shared_ptr<const Repeater> r, MetricsSink& metrics)
    : toolName {std::move(tool)}, executor {std::move(r)}, sink {metrics} {
    if (!executor) {
        throw std::invalid_argument("Retry executor must not be null.");
    }
}

std::expected<std::monostate, Error> InstrumentedRepeater::attempt(
    const Context& ctx,
    const std::function<std::expected<std::monostate, Error>(int)>& fn) const {
    return attemptWithData(ctx, fn);
}

void InstrumentedRepeater::finished(int attempts, const Error* error) const {
    if (error == nullptr) {
        if (attempts > 1) {
            spdlog::info("{} succeeded after {} attempts", toolName, attempts);
            sink.retrySuccess(toolName);
        }
        return;
    }
    switch (error->code) {
        case ErrorCode::RetryExhausted:
            spdlog::warn("{} exhausted retries: {}", toolName, error->what);
            sink.retryExhausted(toolName);
            break;
        case ErrorCode::Cancelled:
        case ErrorCode::Timeout:
            spdlog::debug("{} retry interrupted after {} attempts: {}", toolName, attempts, error->what);
            sink.retryFailed(toolName);
            break;
        default:
            spdlog::debug("{} failed with non-retriable error after {} attempts: {}", toolName, attempts, error->what);
            sink.retryFailed(toolName);
            break;
    }
}

const std::string& InstrumentedRepeater::tool() const {
    return toolName;
}

const Repeater& InstrumentedRepeater::repeater() const {
    return *executor;
}

} // namespace toolgate
