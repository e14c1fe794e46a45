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
#ifndef TOOLGATE_CONFIG_H
#define TOOLGATE_CONFIG_H

#include <chrono>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "common/Error.hpp"
#include "common/Logging.hpp"
#include "ratelimit/RateLimitConfig.hpp"
#include "resilience/CircuitBreaker.hpp"
#include "resilience/RetryPolicy.hpp"

namespace toolgate {

struct ServerSettings {
    std::string name {"toolgate"};
    std::string version {"0.1.0"};
    // "stdio" or "grpc"
    std::string transport {"stdio"};
    std::string listenAddress {"localhost:50051"};
};

struct TimeoutSettings {
    std::chrono::microseconds defaultTimeout {std::chrono::seconds {30}};
    std::chrono::microseconds shutdown {std::chrono::seconds {30}};
};

struct ToolSettings {
    std::chrono::microseconds timeout {std::chrono::seconds {30}};
    int maxFailures {5};
    std::chrono::microseconds openTimeout {std::chrono::seconds {30}};
    int maxHalfOpenRequests {3};
};

struct DocLookupSettings {
    std::string goBinary {"go"};
    // Empty searches upward from the process directory for go.mod.
    std::string workingDir {};
};

struct ToolRateLimitSettings {
    bool enabled {true};
    int limit {50};
    std::chrono::microseconds window {std::chrono::minutes {1}};
};

struct RateLimitSettings {
    bool enabled {true};
    int limit {100};
    std::chrono::microseconds window {std::chrono::minutes {1}};
    std::string mode {"per-tool"};
    std::string algorithm {"token-bucket"};
    std::string storeType {"memory"};
    std::string keyPrefix {"toolgate"};
    std::map<std::string, ToolRateLimitSettings> tools {};
};

struct ToolRetrySettings {
    bool enabled {true};
    int maxAttempts {3};
    std::chrono::microseconds initialDelay {std::chrono::seconds {1}};
    std::chrono::microseconds maxDelay {std::chrono::seconds {15}};
    std::string strategy {"exponential"};
};

struct RetrySettings {
    bool enabled {true};
    int maxAttempts {3};
    std::chrono::microseconds initialDelay {std::chrono::seconds {1}};
    std::chrono::microseconds maxDelay {std::chrono::seconds {30}};
    double multiplier {2.0};
    bool jitter {true};
    std::string strategy {"exponential"};
    std::map<std::string, ToolRetrySettings> tools {};
};

struct Config {
    ServerSettings server {};
    LoggingConfig logging {};
    TimeoutSettings timeouts {};
    DocLookupSettings docLookup {};
    std::map<std::string, ToolSettings> tools {};
    RateLimitSettings rateLimit {};
    RetrySettings retry {};

    // Built-in tool limits for go-doc, code-review and test-gen.
    static Config defaults();

    std::expected<std::monostate, Error> validate() const;

    // The builders throw std::invalid_argument on invalid settings.
    [[nodiscard]] RateLimitConfig rateLimitConfig() const;
    [[nodiscard]] CircuitBreakerConfig circuitBreakerConfig(const std::string& tool) const;
    // Empty when retries are disabled globally or for the tool.
    [[nodiscard]] std::optional<RetryPolicy> retryPolicy(const std::string& tool) const;
    [[nodiscard]] std::chrono::microseconds toolTimeout(const std::string& tool) const;
};

using Getenv = std::function<std::optional<std::string>(const std::string&)>;

// Process environment lookup.
std::optional<std::string> systemGetenv(const std::string& name);

std::expected<std::monostate, Error> applyJson(Config& config, const nlohmann::json& j);
std::expected<std::monostate, Error> applyEnvironment(Config& config, const Getenv& getenv);

// Defaults, then the JSON file at path (if non-empty), then TOOLGATE_*
// environment overrides, then validation.
std::expected<Config, Error> loadConfig(const std::string& path, const Getenv& getenv = systemGetenv);

nlohmann::json toJson(const Config& config);

} // namespace toolgate

#endif // TOOLGATE_CONFIG_H
