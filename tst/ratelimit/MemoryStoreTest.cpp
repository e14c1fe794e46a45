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
#include <string>
#include <thread>
#include <vector>
#include "ratelimit/MemoryStore.hpp"
#include "ratelimit/NoOpStore.hpp"

using toolgate::MemoryStore;
using toolgate::NoOpStore;
using std::chrono::milliseconds;

TEST(MemoryStoreTest, IncrementCountsWithinWindow) {
    MemoryStore store;
    EXPECT_EQ(store.increment("k", milliseconds {1000}).value(), 1);
    EXPECT_EQ(store.increment("k", milliseconds {1000}).value(), 2);
    EXPECT_EQ(store.increment("k", milliseconds {1000}).value(), 3);
    EXPECT_EQ(store.get("k").value(), 3);
    EXPECT_EQ(store.get("other").value(), 0);
}

TEST(MemoryStoreTest, WindowExpiryStartsFresh) {
    MemoryStore store;
    EXPECT_EQ(store.increment("k", milliseconds {30}).value(), 1);
    EXPECT_EQ(store.increment("k", milliseconds {30}).value(), 2);
    std::this_thread::sleep_for(milliseconds {50});
    EXPECT_EQ(store.get("k").value(), 0);
    EXPECT_EQ(store.increment("k", milliseconds {30}).value(), 1);
}

TEST(MemoryStoreTest, ResetAndErase) {
    MemoryStore store;
    static_cast<void>(store.increment("a", milliseconds {1000}));
    static_cast<void>(store.increment("b", milliseconds {1000}));
    EXPECT_TRUE(store.reset("a").has_value());
    EXPECT_EQ(store.get("a").value(), 0);
    EXPECT_TRUE(store.erase("b").has_value());
    EXPECT_EQ(store.size(), 0U);
    EXPECT_TRUE(store.erase("missing").has_value());
}

TEST(MemoryStoreTest, EvictsIdleBuckets) {
    MemoryStore store {std::chrono::minutes {5}, milliseconds {20}};
    static_cast<void>(store.increment("old", milliseconds {1000}));
    std::this_thread::sleep_for(milliseconds {40});
    static_cast<void>(store.increment("fresh", milliseconds {1000}));
    EXPECT_EQ(store.evictIdle(), 1U);
    EXPECT_EQ(store.size(), 1U);
    EXPECT_EQ(store.get("fresh").value(), 1);
}

TEST(MemoryStoreTest, BackgroundEvictionRuns) {
    MemoryStore store {milliseconds {10}, milliseconds {10}};
    static_cast<void>(store.increment("k", milliseconds {1000}));
    std::this_thread::sleep_for(milliseconds {100});
    EXPECT_EQ(store.size(), 0U);
    store.close();
    store.close();
}

TEST(MemoryStoreTest, ConcurrentIncrementsAreExact) {
    MemoryStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store]() {
            for (int i = 0; i < 250; ++i) {
                static_cast<void>(store.increment("shared", std::chrono::minutes {1}));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(store.get("shared").value(), 2000);
}

TEST(NoOpStoreTest, AlwaysFirstRequest) {
    NoOpStore store;
    EXPECT_EQ(store.increment("k", milliseconds {10}).value(), 1);
    EXPECT_EQ(store.increment("k", milliseconds {10}).value(), 1);
    EXPECT_EQ(store.get("k").value(), 0);
    EXPECT_TRUE(store.reset("k").has_value());
    EXPECT_TRUE(store.erase("k").has_value());
}
