/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/capacity.hpp"
#include "buildq/types.hpp"
#include <gtest/gtest.h>

using namespace buildq;

TEST(CapacityTest, StartsAtOneSlotPerWorker) {
    Capacity capacity(2, 2);
    EXPECT_EQ(capacity.current(), 2u);
    EXPECT_EQ(capacity.maximum(), 4u);
    EXPECT_FALSE(capacity.expanded());
}

TEST(CapacityTest, ExpandMultipliesBySubprocessSlots) {
    Capacity capacity(3, 4);
    EXPECT_TRUE(capacity.expand());
    EXPECT_TRUE(capacity.expanded());
    EXPECT_EQ(capacity.current(), 12u);
}

TEST(CapacityTest, ExpandIsIdempotent) {
    Capacity capacity(2, 2);
    EXPECT_TRUE(capacity.expand());
    const auto once = capacity.current();
    EXPECT_FALSE(capacity.expand());
    EXPECT_EQ(capacity.current(), once);
}

TEST(CapacityTest, SingleSlotPerWorkerNeverGrows) {
    Capacity capacity(5, 1);
    capacity.expand();
    EXPECT_EQ(capacity.current(), 5u);
}

TEST(CapacityTest, RejectsNonPositiveCounts) {
    EXPECT_THROW(Capacity(0, 2), ConfigError);
    EXPECT_THROW(Capacity(2, 0), ConfigError);
    EXPECT_THROW(Capacity(-1, 1), ConfigError);
}

TEST(CapacityTest, RejectsProductBeyondIntRange) {
    EXPECT_THROW(Capacity(65536, 65536), ConfigError);
    EXPECT_NO_THROW(Capacity(46340, 46340));
}
