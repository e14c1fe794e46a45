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
#include <stdexcept>
#include "resilience/Jitter.hpp"

using toolgate::Jitter;

TEST(JitterTest, StaysWithinQuarterOfInput) {
    const Jitter jitter {};
    const std::chrono::microseconds base {100000};
    bool varied = false;
    for (int i = 0; i < 1000; ++i) {
        const auto d = jitter.apply(base);
        EXPECT_GE(d, std::chrono::microseconds {75000});
        EXPECT_LE(d, std::chrono::microseconds {125000});
        varied = varied || d != base;
    }
    EXPECT_TRUE(varied);
}

TEST(JitterTest, ZeroStaysZero) {
    const Jitter jitter {};
    EXPECT_EQ(jitter.apply(std::chrono::microseconds {0}), std::chrono::microseconds {0});
}

TEST(JitterTest, NoSpreadIsIdentity) {
    const Jitter jitter {0.0};
    EXPECT_EQ(jitter.apply(std::chrono::microseconds {1234}), std::chrono::microseconds {1234});
}

TEST(JitterTest, RejectsInvalidInput) {
    EXPECT_THROW(Jitter {-0.1}, std::invalid_argument);
    EXPECT_THROW(Jitter {1.5}, std::invalid_argument);
    const Jitter jitter {};
    EXPECT_THROW(static_cast<void>(jitter.apply(std::chrono::microseconds {-1})), std::invalid_argument);
}
