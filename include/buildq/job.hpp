/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "buildq/logger.hpp"
#include "buildq/types.hpp"

namespace buildq {

struct Progress {
    LogLevel level = LogLevel::INFO;
    std::string message;
};

// Handed to a running job so it can emit progress lines. Reports never
// influence scheduling.
class Reporter {
public:
    virtual ~Reporter() = default;

    void report(const Progress& progress) { emit(progress); }
    void report(const std::string& message) { emit(Progress{LogLevel::INFO, message}); }
    void warn(const std::string& message) { emit(Progress{LogLevel::WARN, message}); }
    void error(const std::string& message) { emit(Progress{LogLevel::ERROR, message}); }

private:
    virtual void emit(const Progress& progress) = 0;
};

struct Job {
    std::string name;
    std::function<JobValue(Reporter&)> execute;
};

// Job failure carrying diagnostic lines (e.g. the tail of a build log).
class JobError : public std::runtime_error {
public:
    explicit JobError(const std::string& what, std::vector<std::string> records = {})
        : std::runtime_error(what), records_(std::move(records)) {}

    [[nodiscard]] const std::vector<std::string>& records() const noexcept { return records_; }

private:
    std::vector<std::string> records_;
};

// Completes with the job's value, or rethrows whatever the job threw.
using JobHandle = std::shared_future<JobValue>;

struct JobResult {
    std::string name;
    // Position in dispatch order; equals enqueue order.
    std::uint64_t startSequence = 0;
    JobStatus status = JobStatus::Fulfilled;
    JobValue value;
    std::string error;
    std::vector<std::string> records;
    std::chrono::steady_clock::time_point startedAt;
    std::chrono::steady_clock::time_point finishedAt;
    std::chrono::milliseconds duration{0};
    std::vector<std::string> logs;

    [[nodiscard]] bool ok() const noexcept { return status == JobStatus::Fulfilled; }
};

}
