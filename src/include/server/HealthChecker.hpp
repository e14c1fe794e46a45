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
#ifndef TOOLGATE_HEALTH_CHECKER_H
#define TOOLGATE_HEALTH_CHECKER_H

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "resilience/CircuitBreaker.hpp"

namespace toolgate {

enum class HealthStatus : char {
    Healthy,
    Degraded,
    Unhealthy
};

std::string toString(const HealthStatus& status);

struct HealthCheck {
    std::string name;
    HealthStatus status;
    std::string message;
};

struct Health {
    HealthStatus status;
    std::string version;
    std::chrono::system_clock::time_point timestamp;
    std::chrono::seconds uptime;
    std::vector<HealthCheck> checks;
};

// One check per circuit breaker: closed is healthy, half-open degraded,
// open unhealthy. The process is unhealthy only when every breaker is open
// and degraded when any is not closed.
class HealthChecker {
public:
    HealthChecker(std::string version, std::vector<std::shared_ptr<CircuitBreaker>> breakers);
    Health check() const;
private:
    std::string ver;
    std::vector<std::shared_ptr<CircuitBreaker>> circuits;
    std::chrono::steady_clock::time_point started;
};

nlohmann::json toJson(const Health& health);

} // namespace toolgate

#endif // TOOLGATE_HEALTH_CHECKER_H
