/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>

namespace buildq {

constexpr int kDefaultWorkerThreads = 4;
constexpr int kDefaultSubprocessesPerWorker = 2;

struct BuildConfig {
    int workerThreads = kDefaultWorkerThreads;
    int subprocessesPerWorker = kDefaultSubprocessesPerWorker;
};

// Returns fallback for a missing value. An invalid one (not a positive
// integer) also yields fallback, with a warning naming `source`.
[[nodiscard]] int parsePositiveInteger(const std::optional<std::string>& value, int fallback,
                                       const std::string& source);

// Defaults, then BUILDQ_WORKERS / BUILDQ_SUBPROCESSES, then the flags.
[[nodiscard]] BuildConfig resolveBuildConfig(const std::optional<std::string>& workersFlag,
                                             const std::optional<std::string>& subprocessesFlag);

}
