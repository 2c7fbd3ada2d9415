/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace buildq {

// Job record lifecycle. Fulfilled and Rejected are terminal.
enum class JobState : std::uint8_t { Pending, Running, Fulfilled, Rejected };

// Settlement outcome as seen in the result store.
enum class JobStatus : std::uint8_t { Fulfilled, Rejected };

// Value produced by a fulfilled job.
using JobValue = std::string;

// Misuse of the scheduler API (bad capacity numbers, malformed job).
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

[[nodiscard]] inline const char* toString(JobStatus status) noexcept {
    return status == JobStatus::Fulfilled ? "fulfilled" : "rejected";
}

[[nodiscard]] inline const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Pending:   return "pending";
        case JobState::Running:   return "running";
        case JobState::Fulfilled: return "fulfilled";
        case JobState::Rejected:  return "rejected";
    }
    return "unknown";
}

} // namespace buildq
