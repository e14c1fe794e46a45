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
#include <chrono>
#include <thread>
#include "common/Context.hpp"
#include "common/Error.hpp"

using toolgate::Context;
using toolgate::ErrorCode;

TEST(ContextTest, FreshContextIsNotDone) {
    const Context ctx {};
    EXPECT_FALSE(ctx.done());
    EXPECT_FALSE(ctx.err().has_value());
    EXPECT_FALSE(ctx.deadline().has_value());
}

TEST(ContextTest, CancelReportsCancelled) {
    const Context ctx {};
    ctx.cancel();
    ASSERT_TRUE(ctx.err().has_value());
    EXPECT_EQ(ctx.err()->code, ErrorCode::Cancelled);
    EXPECT_EQ(ctx.err()->what, "context cancelled");
}

TEST(ContextTest, CopiesShareCancellation) {
    const Context ctx {};
    const Context copy = ctx;
    ctx.cancel();
    EXPECT_TRUE(copy.done());
}

TEST(ContextTest, ParentCancellationReachesChild) {
    const Context parent {};
    const auto child = parent.withCancel();
    const auto grandchild = child.withTimeout(std::chrono::seconds {10});
    parent.cancel();
    EXPECT_TRUE(child.done());
    EXPECT_TRUE(grandchild.done());
    EXPECT_EQ(grandchild.err()->code, ErrorCode::Cancelled);
}

TEST(ContextTest, ChildCancellationDoesNotReachParent) {
    const Context parent {};
    const auto child = parent.withCancel();
    child.cancel();
    EXPECT_TRUE(child.done());
    EXPECT_FALSE(parent.done());
}

TEST(ContextTest, DeadlineExpires) {
    const Context ctx {};
    const auto timed = ctx.withTimeout(std::chrono::milliseconds {20});
    EXPECT_FALSE(timed.done());
    std::this_thread::sleep_for(std::chrono::milliseconds {40});
    ASSERT_TRUE(timed.err().has_value());
    EXPECT_EQ(timed.err()->code, ErrorCode::Timeout);
    EXPECT_EQ(timed.err()->what, "context deadline exceeded");
    EXPECT_FALSE(ctx.done());
}

TEST(ContextTest, ChildNeverOutlivesParentDeadline) {
    const Context ctx {};
    const auto parent = ctx.withTimeout(std::chrono::milliseconds {50});
    const auto child = parent.withTimeout(std::chrono::seconds {10});
    ASSERT_TRUE(child.deadline().has_value());
    EXPECT_EQ(child.deadline().value(), parent.deadline().value());
}

TEST(ContextTest, SleepForCompletes) {
    const Context ctx {};
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(ctx.sleepFor(std::chrono::milliseconds {20}));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds {20});
}

TEST(ContextTest, SleepForWakesOnCancel) {
    const Context ctx {};
    std::thread canceller([ctx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds {20});
        ctx.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ctx.sleepFor(std::chrono::seconds {5}));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds {2});
    canceller.join();
}

TEST(ContextTest, SleepForStopsAtDeadline) {
    const Context ctx {};
    const auto timed = ctx.withTimeout(std::chrono::milliseconds {20});
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(timed.sleepFor(std::chrono::seconds {5}));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds {2});
}

TEST(ContextTest, SleepForOnDoneContextReturnsImmediately) {
    const Context ctx {};
    ctx.cancel();
    EXPECT_FALSE(ctx.sleepFor(std::chrono::seconds {5}));
}
