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
#include "common/Context.hpp"
#include "common/Error.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace toolgate {

struct Context::State {
    std::stop_source source;
    std::optional<Clock::time_point> deadline;
    std::shared_ptr<State> parent;
    std::optional<std::stop_callback<std::function<void()>>> link;
    std::mutex m;
    std::condition_variable_any cv;
};

Context::Context() : state {std::make_shared<State>()} {}

Context::Context(std::shared_ptr<State> s) : state {std::move(s)} {}

Context Context::derive(std::optional<Clock::time_point> d) const {
    auto child = std::make_shared<State>();
    child->deadline = state->deadline;
    if (d.has_value() && (!child->deadline.has_value() || d.value() < child->deadline.value())) {
        child->deadline = d;
    }
    child->parent = state;
    child->link.emplace(state->source.get_token(), [source = child->source]() mutable {
        source.request_stop();
    });
    return Context {std::move(child)};
}

Context Context::withCancel() const {
    return derive(std::nullopt);
}

Context Context::withTimeout(std::chrono::microseconds timeout) const {
    return derive(Clock::now() + timeout);
}

Context Context::withDeadline(Clock::time_point d) const {
    return derive(d);
}

void Context::cancel() const {
    state->source.request_stop();
}

std::optional<Error> Context::err() const {
    if (state->source.stop_requested()) {
        return Error {ErrorCode::Cancelled, "context cancelled"};
    }
    if (state->deadline.has_value() && Clock::now() >= state->deadline.value()) {
        return Error {ErrorCode::Timeout, "context deadline exceeded"};
    }
    return std::nullopt;
}

bool Context::done() const {
    return err().has_value();
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    return state->deadline;
}

std::stop_token Context::stopToken() const {
    return state->source.get_token();
}

bool Context::sleepFor(std::chrono::microseconds d) const {
    if (done()) {
        return false;
    }
    if (d <= std::chrono::microseconds::zero()) {
        return true;
    }
    auto until = Clock::now() + d;
    bool capped = false;
    if (state->deadline.has_value() && state->deadline.value() < until) {
        until = state->deadline.value();
        capped = true;
    }
    auto token = state->source.get_token();
    std::unique_lock lock {state->m};
    state->cv.wait_until(lock, token, until, [] { return false; });
    return !token.stop_requested() && !capped;
}

} // namespace toolgate
