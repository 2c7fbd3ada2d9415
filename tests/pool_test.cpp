/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/pool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace buildq;

namespace {
bool waitFor(const std::atomic<int>& counter, int expected) {
    for (int i = 0; i < 500; ++i) {
        if (counter.load() == expected) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}
}

TEST(PoolTest, RunsSubmittedTasks) {
    Pool pool(3);
    ASSERT_TRUE(pool.start());
    EXPECT_EQ(pool.workerCount(), 3);

    std::atomic<int> done{0};
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(pool.submit([&done](int) { done.fetch_add(1); }));
    }
    EXPECT_TRUE(waitFor(done, 20));
    pool.stop();
    EXPECT_FALSE(pool.isRunning());
}

TEST(PoolTest, PassesWorkerIdInRange) {
    Pool pool(2);
    ASSERT_TRUE(pool.start());

    std::atomic<int> done{0};
    std::atomic<bool> outOfRange{false};
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool.submit([&](int workerId) {
            if (workerId < 0 || workerId >= 2) outOfRange = true;
            done.fetch_add(1);
        }));
    }
    EXPECT_TRUE(waitFor(done, 10));
    EXPECT_FALSE(outOfRange.load());
}

TEST(PoolTest, RejectsSubmitWhenStopped) {
    Pool pool(1);
    EXPECT_FALSE(pool.submit([](int) {}));
    ASSERT_TRUE(pool.start());
    pool.stop();
    EXPECT_FALSE(pool.submit([](int) {}));
}

TEST(PoolTest, RejectsEmptyTaskAndDoubleStart) {
    Pool pool(1);
    ASSERT_TRUE(pool.start());
    EXPECT_FALSE(pool.start());
    EXPECT_FALSE(pool.submit(Task()));
}

TEST(PoolTest, SurvivesThrowingTask) {
    Pool pool(1);
    ASSERT_TRUE(pool.start());
    std::atomic<int> done{0};
    ASSERT_TRUE(pool.submit([](int) { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(pool.submit([&done](int) { done.fetch_add(1); }));
    EXPECT_TRUE(waitFor(done, 1));
}

TEST(PoolTest, ZeroWorkersFailsToStart) {
    Pool pool(0);
    EXPECT_FALSE(pool.start());
    EXPECT_FALSE(pool.isRunning());
}

TEST(PoolTest, GrowAddsWorkersThatTakeTasks) {
    Pool pool(1);
    ASSERT_TRUE(pool.start());
    ASSERT_TRUE(pool.grow(3));
    EXPECT_EQ(pool.workerCount(), 3);
    ASSERT_TRUE(pool.grow(2));
    EXPECT_EQ(pool.workerCount(), 3);

    // Three tasks that each wait for the other two
    std::atomic<int> arrived{0};
    std::atomic<int> done{0};
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(pool.submit([&](int) {
            arrived.fetch_add(1);
            waitFor(arrived, 3);
            done.fetch_add(1);
        }));
    }
    EXPECT_TRUE(waitFor(done, 3));
    EXPECT_EQ(arrived.load(), 3);
    pool.stop();
    EXPECT_FALSE(pool.grow(4));
}
