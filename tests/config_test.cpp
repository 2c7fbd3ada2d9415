/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/config.hpp"
#include "buildq/logger.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <string>

using namespace buildq;

namespace {

class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        if (const char* prev = std::getenv(name)) {
            prev_ = prev;
            hadPrev_ = true;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }
    ~EnvGuard() {
        if (hadPrev_) {
            setenv(name_.c_str(), prev_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }
    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    std::string name_;
    std::string prev_;
    bool hadPrev_ = false;
};

}

TEST(ConfigTest, ParsePositiveIntegerAcceptsValidValues) {
    EXPECT_EQ(parsePositiveInteger(std::string("6"), 4, "test"), 6);
    EXPECT_EQ(parsePositiveInteger(std::nullopt, 4, "test"), 4);
    EXPECT_EQ(parsePositiveInteger(std::string(""), 4, "test"), 4);
}

TEST(ConfigTest, ParsePositiveIntegerFallsBackOnGarbage) {
    EXPECT_EQ(parsePositiveInteger(std::string("0"), 4, "test"), 4);
    EXPECT_EQ(parsePositiveInteger(std::string("-2"), 4, "test"), 4);
    EXPECT_EQ(parsePositiveInteger(std::string("three"), 4, "test"), 4);
    EXPECT_EQ(parsePositiveInteger(std::string("5x"), 4, "test"), 4);
    EXPECT_EQ(parsePositiveInteger(std::string("99999999999999"), 4, "test"), 4);
}

TEST(ConfigTest, DefaultsWithoutEnvironmentOrFlags) {
    EnvGuard workers("BUILDQ_WORKERS", nullptr);
    EnvGuard subprocesses("BUILDQ_SUBPROCESSES", nullptr);

    const auto config = resolveBuildConfig(std::nullopt, std::nullopt);
    EXPECT_EQ(config.workerThreads, kDefaultWorkerThreads);
    EXPECT_EQ(config.subprocessesPerWorker, kDefaultSubprocessesPerWorker);
}

TEST(ConfigTest, FlagsOverrideEnvironment) {
    EnvGuard workers("BUILDQ_WORKERS", "3");
    EnvGuard subprocesses("BUILDQ_SUBPROCESSES", "5");

    auto config = resolveBuildConfig(std::nullopt, std::nullopt);
    EXPECT_EQ(config.workerThreads, 3);
    EXPECT_EQ(config.subprocessesPerWorker, 5);

    config = resolveBuildConfig(std::string("8"), std::string("bogus"));
    EXPECT_EQ(config.workerThreads, 8);
    EXPECT_EQ(config.subprocessesPerWorker, 5);
}

TEST(ConfigTest, ParsesLogLevels) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parseLevel("Warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(Logger::parseLevel("TRACE", level));
    EXPECT_EQ(level, LogLevel::TRACE);
    EXPECT_FALSE(Logger::parseLevel("loud", level));
    EXPECT_EQ(level, LogLevel::TRACE);
}
