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
#ifndef TOOLGATE_METRICS_H
#define TOOLGATE_METRICS_H

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <cstdint>

namespace toolgate {

// Observability hooks injected into the breaker, limiter, retry wrapper and
// pipeline. Every hook defaults to a no-op so sinks override what they need.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void circuitTransition(const std::string& /*name*/, const std::string& /*from*/, const std::string& /*to*/) {}
    virtual void circuitAllowed(const std::string& /*name*/) {}
    virtual void circuitRejected(const std::string& /*name*/) {}

    virtual void rateLimitAllowed(const std::string& /*tool*/, const std::string& /*mode*/) {}
    virtual void rateLimitRejected(const std::string& /*tool*/, const std::string& /*mode*/) {}
    virtual void rateLimitCurrent(const std::string& /*tool*/, const std::string& /*mode*/, int /*count*/) {}

    virtual void retryAttempt(const std::string& /*tool*/, unsigned /*attempt*/, std::chrono::microseconds /*delay*/) {}
    virtual void retrySuccess(const std::string& /*tool*/) {}
    virtual void retryExhausted(const std::string& /*tool*/) {}
    virtual void retryFailed(const std::string& /*tool*/) {}

    virtual void toolCall(const std::string& /*tool*/, const std::string& /*status*/, std::chrono::microseconds /*duration*/) {}
    virtual void activeRequests(const std::string& /*tool*/, int /*delta*/) {}
};

class NoopMetrics final : public MetricsSink {};

// Shared instance for components constructed without a sink.
MetricsSink& noopMetrics();

// Counters and gauges keyed by "<metric>{label,...}".
class InMemoryMetrics final : public MetricsSink {
public:
    struct Snapshot {
        std::map<std::string, uint64_t> counters;
        std::map<std::string, int64_t> gauges;
    };

    void circuitTransition(const std::string& name, const std::string& from, const std::string& to) override;
    void circuitAllowed(const std::string& name) override;
    void circuitRejected(const std::string& name) override;

    void rateLimitAllowed(const std::string& tool, const std::string& mode) override;
    void rateLimitRejected(const std::string& tool, const std::string& mode) override;
    void rateLimitCurrent(const std::string& tool, const std::string& mode, int count) override;

    void retryAttempt(const std::string& tool, unsigned attempt, std::chrono::microseconds delay) override;
    void retrySuccess(const std::string& tool) override;
    void retryExhausted(const std::string& tool) override;
    void retryFailed(const std::string& tool) override;

    void toolCall(const std::string& tool, const std::string& status, std::chrono::microseconds duration) override;
    void activeRequests(const std::string& tool, int delta) override;

    [[nodiscard]] Snapshot snapshot() const;
    [[nodiscard]] uint64_t counter(const std::string& key) const;
    [[nodiscard]] int64_t gauge(const std::string& key) const;
private:
    void add(const std::string& key, uint64_t n = 1);
    void set(const std::string& key, int64_t v);
    mutable std::mutex m;
    Snapshot data;
};

} // namespace toolgate

#endif // TOOLGATE_METRICS_H
