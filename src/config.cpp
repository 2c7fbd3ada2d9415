/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/config.hpp"
#include "buildq/logger.hpp"
#include <cstdlib>
#include <limits>

namespace buildq {

namespace {
std::optional<std::string> env_value(const char* name) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return std::nullopt;
    }
    return std::string(val);
}
}

int parsePositiveInteger(const std::optional<std::string>& value, int fallback, const std::string& source) {
    if (!value || value->empty()) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        long parsed = std::stol(*value, &consumed);
        if (consumed == value->size() && parsed > 0 && parsed <= std::numeric_limits<int>::max()) {
            return static_cast<int>(parsed);
        }
    } catch (const std::exception&) {
        // fall through to the warning below
    }
    LOG_WARN("Ignoring invalid " + source + " value (" + *value + "); using " + std::to_string(fallback));
    return fallback;
}

BuildConfig resolveBuildConfig(const std::optional<std::string>& workersFlag,
                               const std::optional<std::string>& subprocessesFlag) {
    BuildConfig config;
    config.workerThreads = parsePositiveInteger(env_value("BUILDQ_WORKERS"), config.workerThreads, "BUILDQ_WORKERS");
    config.subprocessesPerWorker = parsePositiveInteger(env_value("BUILDQ_SUBPROCESSES"),
                                                        config.subprocessesPerWorker, "BUILDQ_SUBPROCESSES");

    config.workerThreads = parsePositiveInteger(workersFlag, config.workerThreads, "--workers");
    config.subprocessesPerWorker = parsePositiveInteger(subprocessesFlag, config.subprocessesPerWorker,
                                                        "--subprocesses");

    LOG_DEBUG("Build config - workers: " + std::to_string(config.workerThreads) +
              ", subprocesses per worker: " + std::to_string(config.subprocessesPerWorker));
    return config;
}

}
