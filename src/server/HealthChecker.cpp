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
#include "server/HealthChecker.hpp"
#include "resilience/CircuitBreaker.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace toolgate {

std::string toString(const HealthStatus& status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    std::unreachable();
}

HealthChecker::HealthChecker(std::string version, std::vector<std::shared_ptr<CircuitBreaker>> breakers)
    : ver {std::move(version)},
      circuits {std::move(breakers)},
      started {std::chrono::steady_clock::now()} {}

Health HealthChecker::check() const {
    Health h {
        HealthStatus::Healthy,
        ver,
        std::chrono::system_clock::now(),
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started),
        {}
    };
    size_t open = 0;
    for (const auto& cb : circuits) {
        HealthCheck c {"circuit_breaker:" + cb->name(), HealthStatus::Healthy, cb->toString()};
        switch (cb->state()) {
            case CircuitBreaker::State::Closed:
                break;
            case CircuitBreaker::State::HalfOpen:
                c.status = HealthStatus::Degraded;
                break;
            case CircuitBreaker::State::Open:
                c.status = HealthStatus::Unhealthy;
                ++open;
                break;
        }
        if (c.status != HealthStatus::Healthy) {
            h.status = HealthStatus::Degraded;
        }
        h.checks.push_back(std::move(c));
    }
    if (!circuits.empty() && open == circuits.size()) {
        h.status = HealthStatus::Unhealthy;
    }
    return h;
}

nlohmann::json toJson(const Health& health) {
    auto checks = nlohmann::json::object();
    for (const auto& c : health.checks) {
        checks[c.name] = {
            {"status", toString(c.status)},
            {"message", c.message}
        };
    }
    return {
        {"status", toString(health.status)},
        {"version", health.version},
        {"timestamp", fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(std::chrono::system_clock::to_time_t(health.timestamp)))},
        {"uptime_seconds", health.uptime.count()},
        {"checks", checks}
    };
}

} // namespace toolgate
