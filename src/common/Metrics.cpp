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
#include "common/Metrics.hpp"
#include <fmt/format.h>
#include <chrono>
#include <mutex>
#include <string>

namespace toolgate {

MetricsSink& noopMetrics() {
    static NoopMetrics instance;
    return instance;
}

void InMemoryMetrics::add(const std::string& key, uint64_t n) {
    const std::lock_guard lock {m};
    data.counters[key] += n;
}

void InMemoryMetrics::set(const std::string& key, int64_t v) {
    const std::lock_guard lock {m};
    data.gauges[key] = v;
}

void InMemoryMetrics::circuitTransition(const std::string& name, const std::string& from, const std::string& to) {
    add(fmt::format("circuit_breaker_transitions_total{{{},{},{}}}", name, from, to));
    set(fmt::format("circuit_breaker_state{{{}}}", name), to == "closed" ? 0 : (to == "half-open" ? 1 : 2));
}

void InMemoryMetrics::circuitAllowed(const std::string& name) {
    add(fmt::format("circuit_breaker_requests_allowed_total{{{}}}", name));
}

void InMemoryMetrics::circuitRejected(const std::string& name) {
    add(fmt::format("circuit_breaker_requests_rejected_total{{{}}}", name));
}

void InMemoryMetrics::rateLimitAllowed(const std::string& tool, const std::string& mode) {
    add(fmt::format("ratelimit_allowed_total{{{},{}}}", tool, mode));
}

void InMemoryMetrics::rateLimitRejected(const std::string& tool, const std::string& mode) {
    add(fmt::format("ratelimit_rejected_total{{{},{}}}", tool, mode));
}

void InMemoryMetrics::rateLimitCurrent(const std::string& tool, const std::string& mode, int count) {
    set(fmt::format("ratelimit_current{{{},{}}}", tool, mode), count);
}

void InMemoryMetrics::retryAttempt(const std::string& tool, unsigned /*attempt*/, std::chrono::microseconds delay) {
    add(fmt::format("retry_attempts_total{{{}}}", tool));
    add(fmt::format("retry_delay_us_total{{{}}}", tool), static_cast<uint64_t>(delay.count()));
}

void InMemoryMetrics::retrySuccess(const std::string& tool) {
    add(fmt::format("retries_total{{{},success}}", tool));
}

void InMemoryMetrics::retryExhausted(const std::string& tool) {
    add(fmt::format("retries_total{{{},exhausted}}", tool));
}

void InMemoryMetrics::retryFailed(const std::string& tool) {
    add(fmt::format("retries_total{{{},failed}}", tool));
}

void InMemoryMetrics::toolCall(const std::string& tool, const std::string& status, std::chrono::microseconds duration) {
    add(fmt::format("tool_calls_total{{{},{}}}", tool, status));
    add(fmt::format("tool_duration_us_total{{{}}}", tool), static_cast<uint64_t>(duration.count()));
}

void InMemoryMetrics::activeRequests(const std::string& tool, int delta) {
    const std::lock_guard lock {m};
    data.gauges[fmt::format("requests_active{{{}}}", tool)] += delta;
}

InMemoryMetrics::Snapshot InMemoryMetrics::snapshot() const {
    const std::lock_guard lock {m};
    return data;
}

uint64_t InMemoryMetrics::counter(const std::string& key) const {
    const std::lock_guard lock {m};
    auto it = data.counters.find(key);
    return it == data.counters.end() ? 0 : it->second;
}

int64_t InMemoryMetrics::gauge(const std::string& key) const {
    const std::lock_guard lock {m};
    auto it = data.gauges.find(key);
    return it == data.gauges.end() ? 0 : it->second;
}

} // namespace toolgate
