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
#ifndef TOOLGATE_CONTEXT_H
#define TOOLGATE_CONTEXT_H

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include "common/Error.hpp"

namespace toolgate {

// Cancellation and deadline carried through a single tool invocation.
// Copies share state; derived contexts are cancelled with their parent and
// never outlive its deadline.
class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context();

    [[nodiscard]] Context withCancel() const;
    [[nodiscard]] Context withTimeout(std::chrono::microseconds timeout) const;
    [[nodiscard]] Context withDeadline(Clock::time_point deadline) const;

    void cancel() const;

    // Cancelled if cancel() was called on this context or an ancestor,
    // Timeout once the deadline has passed, empty otherwise.
    [[nodiscard]] std::optional<Error> err() const;
    [[nodiscard]] bool done() const;
    [[nodiscard]] std::optional<Clock::time_point> deadline() const;
    [[nodiscard]] std::stop_token stopToken() const;

    // Blocks for d, returning early on cancellation or deadline.
    // Returns true only if the full duration elapsed.
    bool sleepFor(std::chrono::microseconds d) const;
private:
    struct State;
    explicit Context(std::shared_ptr<State> s);
    [[nodiscard]] Context derive(std::optional<Clock::time_point> deadline) const;
    std::shared_ptr<State> state;
};

} // namespace toolgate

#endif // TOOLGATE_CONTEXT_H
