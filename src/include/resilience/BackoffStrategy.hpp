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
#ifndef TOOLGATE_BACKOFF_STRATEGY_H
#define TOOLGATE_BACKOFF_STRATEGY_H

#include <chrono>
#include <memory>
#include <string>
#include "resilience/Jitter.hpp"
#include "resilience/RetryPolicy.hpp"

namespace toolgate {

// Maps a zero-based attempt index to the delay before the next attempt.
// Implementations hold no per-call state.
class BackoffStrategy {
public:
    virtual ~BackoffStrategy() = default;
    [[nodiscard]] virtual std::chrono::microseconds nextDelay(int attempt) const = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

class NoBackoff final : public BackoffStrategy {
public:
    [[nodiscard]] std::chrono::microseconds nextDelay(int attempt) const override;
    [[nodiscard]] std::string name() const override;
};

class ConstantBackoff final : public BackoffStrategy {
public:
    explicit ConstantBackoff(std::chrono::microseconds d);
    [[nodiscard]] std::chrono::microseconds nextDelay(int attempt) const override;
    [[nodiscard]] std::string name() const override;
private:
    std::chrono::microseconds delay;
};

class LinearBackoff final : public BackoffStrategy {
public:
    LinearBackoff(std::chrono::microseconds initial, std::chrono::microseconds max);
    [[nodiscard]] std::chrono::microseconds nextDelay(int attempt) const override;
    [[nodiscard]] std::string name() const override;
private:
    std::chrono::microseconds initialDelay;
    std::chrono::microseconds maxDelay;
};

class ExponentialBackoff final : public BackoffStrategy {
public:
    ExponentialBackoff(std::chrono::microseconds initial, std::chrono::microseconds max, double multiplier, bool jitter);
    [[nodiscard]] std::chrono::microseconds nextDelay(int attempt) const override;
    [[nodiscard]] std::string name() const override;
private:
    std::chrono::microseconds initialDelay;
    std::chrono::microseconds maxDelay;
    double factor;
    bool jitterEnabled;
    Jitter jitter;
};

std::unique_ptr<BackoffStrategy> makeBackoffStrategy(const RetryPolicy& policy);

} // namespace toolgate

#endif // TOOLGATE_BACKOFF_STRATEGY_H
