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
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include "common/Context.hpp"
#include "common/Error.hpp"
#include "common/Metrics.hpp"
#include "ratelimit/CounterStore.hpp"
#include "ratelimit/MemoryStore.hpp"
#include "ratelimit/RateLimitConfig.hpp"
#include "ratelimit/RateLimiter.hpp"
#include "resilience/CircuitBreaker.hpp"
#include "resilience/InstrumentedRepeater.hpp"
#include "resilience/Pipeline.hpp"
#include "resilience/Repeater.hpp"
#include "resilience/RetryPolicy.hpp"

using toolgate::CircuitBreaker;
using toolgate::CircuitBreakerConfig;
using toolgate::Context;
using toolgate::CounterStore;
using toolgate::Error;
using toolgate::ErrorCode;
using toolgate::InMemoryMetrics;
using toolgate::InstrumentedRepeater;
using toolgate::MemoryStore;
using toolgate::Pipeline;
using toolgate::RateLimitConfig;
using toolgate::RateLimiter;
using toolgate::RateLimitError;
using toolgate::Repeater;
using toolgate::RetryPolicy;
using std::chrono::milliseconds;

namespace {
    class BrokenStore final : public CounterStore {
    public:
        std::expected<int, Error> increment(const std::string&, std::chrono::milliseconds) override {
            return std::unexpected {Error {ErrorCode::StoreFailure, "store down"}};
        }
        std::expected<int, Error> get(const std::string&) const override {
            return std::unexpected {Error {ErrorCode::StoreFailure, "store down"}};
        }
        std::expected<std::monostate, Error> reset(const std::string&) override {
            return {};
        }
        std::expected<std::monostate, Error> erase(const std::string&) override {
            return {};
        }
    };

    std::shared_ptr<CircuitBreaker> breaker(int maxFailures = 3) {
        return std::make_shared<CircuitBreaker>(CircuitBreakerConfig {"go-doc", maxFailures, std::chrono::seconds {10}, 1});
    }

    std::shared_ptr<RateLimiter> limiter(int limit, std::shared_ptr<CounterStore> store) {
        return std::make_shared<RateLimiter>(
            RateLimitConfig {true, limit, std::chrono::minutes {1}, toolgate::RateLimitMode::PerTool,
                toolgate::RateLimitAlgorithm::TokenBucket, toolgate::StoreType::Memory, "toolgate"},
            std::move(store));
    }

    InstrumentedRepeater retrier(int attempts) {
        return InstrumentedRepeater {"go-doc", std::make_shared<const Repeater>(
            RetryPolicy {attempts, milliseconds {1}, milliseconds {2}, 2.0, false, RetryPolicy::Strategy::Constant},
            toolgate::retriableFor("go-doc"))};
    }

    std::expected<std::string, Error> failWith(ErrorCode code) {
        return std::unexpected {Error {code, "boom"}};
    }
} // namespace

TEST(PipelineTest, RejectsInvalidConstruction) {
    EXPECT_THROW(Pipeline("go-doc", nullptr), std::invalid_argument);
    EXPECT_THROW(Pipeline("go-doc", breaker(), nullptr, std::nullopt, milliseconds {0}), std::invalid_argument);
}

TEST(PipelineTest, PassesThroughResult) {
    InMemoryMetrics metrics;
    const Pipeline pipeline {"go-doc", breaker(), nullptr, std::nullopt, std::nullopt, metrics};
    const Context ctx {};
    auto result = pipeline.execute(ctx, "", [](const Context&, int) -> std::expected<std::string, Error> {
        return "docs";
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), "docs");
    EXPECT_EQ(metrics.counter("tool_calls_total{go-doc,success}"), 1U);
    EXPECT_EQ(metrics.gauge("requests_active{go-doc}"), 0);
}

TEST(PipelineTest, ThrowingHandlerReleasesActiveGauge) {
    InMemoryMetrics metrics;
    const Pipeline pipeline {"go-doc", breaker(), nullptr, std::nullopt, std::nullopt, metrics};
    const Context ctx {};
    EXPECT_THROW(static_cast<void>(pipeline.execute(ctx, "", [](const Context&, int) -> std::expected<std::string, Error> {
        throw std::runtime_error {"handler bug"};
    })), std::runtime_error);
    EXPECT_EQ(metrics.gauge("requests_active{go-doc}"), 0);
}

TEST(PipelineTest, RateLimitRejectsBeforeHandler) {
    InMemoryMetrics metrics;
    auto store = std::make_shared<MemoryStore>();
    const Pipeline pipeline {"go-doc", breaker(), limiter(2, store), std::nullopt, std::nullopt, metrics};
    const Context ctx {};
    int calls = 0;
    auto handler = [&calls](const Context&, int) -> std::expected<std::string, Error> {
        ++calls;
        return "ok";
    };
    EXPECT_TRUE(pipeline.execute(ctx, "client", handler).has_value());
    EXPECT_TRUE(pipeline.execute(ctx, "client", handler).has_value());
    auto third = pipeline.execute(ctx, "client", handler);
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(third.error().code, ErrorCode::RateLimited);
    ASSERT_TRUE(std::holds_alternative<RateLimitError>(third.error().details));
    const auto& details = std::get<RateLimitError>(third.error().details);
    EXPECT_EQ(details.key, "toolgate:tool:go-doc:client");
    EXPECT_EQ(details.limit, 2);
    EXPECT_EQ(details.window, std::chrono::minutes {1});
    EXPECT_EQ(metrics.counter("tool_calls_total{go-doc,rate_limit}"), 1U);
    store->stop();
}

TEST(PipelineTest, RateLimitIsPerClient) {
    auto store = std::make_shared<MemoryStore>();
    const Pipeline pipeline {"go-doc", breaker(), limiter(1, store)};
    const Context ctx {};
    auto handler = [](const Context&, int) -> std::expected<std::string, Error> { return "ok"; };
    EXPECT_TRUE(pipeline.execute(ctx, "a", handler).has_value());
    EXPECT_TRUE(pipeline.execute(ctx, "b", handler).has_value());
    EXPECT_FALSE(pipeline.execute(ctx, "a", handler).has_value());
    store->stop();
}

TEST(PipelineTest, RateLimitRejectionDoesNotTouchBreaker) {
    auto store = std::make_shared<MemoryStore>();
    auto cb = breaker(1);
    const Pipeline pipeline {"go-doc", cb, limiter(1, store)};
    const Context ctx {};
    auto handler = [](const Context&, int) -> std::expected<std::string, Error> { return "ok"; };
    EXPECT_TRUE(pipeline.execute(ctx, "", handler).has_value());
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(pipeline.execute(ctx, "", handler).error().code, ErrorCode::RateLimited);
    }
    EXPECT_EQ(cb->state(), CircuitBreaker::State::Closed);
    store->stop();
}

TEST(PipelineTest, StoreFailureFailsOpen) {
    const Pipeline pipeline {"go-doc", breaker(), limiter(1, std::make_shared<BrokenStore>())};
    const Context ctx {};
    int calls = 0;
    auto handler = [&calls](const Context&, int) -> std::expected<std::string, Error> {
        ++calls;
        return "ok";
    };
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(pipeline.execute(ctx, "", handler).has_value());
    }
    EXPECT_EQ(calls, 3);
}

TEST(PipelineTest, RetrySequenceIsOneBreakerTrial) {
    auto cb = breaker(2);
    const Pipeline pipeline {"go-doc", cb, nullptr, retrier(3)};
    const Context ctx {};
    int calls = 0;
    auto result = pipeline.execute(ctx, "", [&calls](const Context&, int) {
        ++calls;
        return failWith(ErrorCode::ToolFailure);
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(result.error().code, ErrorCode::RetryExhausted);
    EXPECT_EQ(cb->failures(), 1);
    EXPECT_EQ(cb->state(), CircuitBreaker::State::Closed);
}

TEST(PipelineTest, RetryRecoversWithoutBreakerFailure) {
    auto cb = breaker(1);
    const Pipeline pipeline {"go-doc", cb, nullptr, retrier(3)};
    const Context ctx {};
    auto result = pipeline.execute(ctx, "", [](const Context&, int attempt) -> std::expected<std::string, Error> {
        if (attempt < 2) {
            return failWith(ErrorCode::Timeout);
        }
        return "third time";
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), "third time");
    EXPECT_EQ(cb->state(), CircuitBreaker::State::Closed);
}

TEST(PipelineTest, OpenBreakerShortCircuits) {
    auto cb = breaker(1);
    const Pipeline pipeline {"go-doc", cb, nullptr, retrier(3)};
    const Context ctx {};
    int calls = 0;
    auto handler = [&calls](const Context&, int) {
        ++calls;
        return failWith(ErrorCode::NotFound);
    };
    EXPECT_EQ(pipeline.execute(ctx, "", handler).error().code, ErrorCode::NotFound);
    EXPECT_EQ(calls, 1);
    auto rejected = pipeline.execute(ctx, "", handler);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::CircuitOpen);
    EXPECT_EQ(calls, 1);
}

TEST(PipelineTest, TimeoutBoundsWholeTrial) {
    const Pipeline pipeline {"go-doc", breaker(), nullptr, std::nullopt, milliseconds {30}};
    const Context ctx {};
    auto result = pipeline.execute(ctx, "", [](const Context& c, int) -> std::expected<std::string, Error> {
        if (!c.sleepFor(std::chrono::seconds {5})) {
            return std::unexpected {c.err().value()};
        }
        return "late";
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
}

TEST(PipelineTest, HandlerSeesCallerCancellation) {
    const Pipeline pipeline {"go-doc", breaker(), nullptr, retrier(3)};
    const Context ctx {};
    ctx.cancel();
    int calls = 0;
    auto result = pipeline.execute(ctx, "", [&calls](const Context&, int) -> std::expected<std::string, Error> {
        ++calls;
        return "ok";
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
}

TEST(PipelineTest, Accessors) {
    auto cb = breaker();
    const Pipeline pipeline {"go-doc", cb, nullptr, retrier(2), milliseconds {100}};
    EXPECT_EQ(pipeline.tool(), "go-doc");
    EXPECT_EQ(pipeline.breaker().get(), cb.get());
    EXPECT_EQ(pipeline.limiter().get(), nullptr);
    EXPECT_TRUE(pipeline.retries());
    ASSERT_TRUE(pipeline.timeout().has_value());
    EXPECT_EQ(pipeline.timeout().value(), milliseconds {100});
}
