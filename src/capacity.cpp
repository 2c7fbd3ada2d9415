/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/capacity.hpp"
#include "buildq/logger.hpp"
#include "buildq/types.hpp"
#include <climits>
#include <string>

namespace buildq {

Capacity::Capacity(int workerCount, int subprocessSlotsPerWorker)
    : workerCount_(workerCount), slotsPerWorker_(subprocessSlotsPerWorker) {
    if (workerCount_ < 1) {
        throw ConfigError("workerCount must be a positive integer (got " + std::to_string(workerCount_) + ")");
    }
    if (slotsPerWorker_ < 1) {
        throw ConfigError("subprocessSlotsPerWorker must be a positive integer (got " +
                          std::to_string(slotsPerWorker_) + ")");
    }
    if (maximum() > static_cast<std::size_t>(INT_MAX)) {
        throw ConfigError("workerCount * subprocessSlotsPerWorker exceeds " + std::to_string(INT_MAX) +
                          " (got " + std::to_string(workerCount_) + " x " + std::to_string(slotsPerWorker_) + ")");
    }
}

std::size_t Capacity::current() const noexcept {
    return expanded_.load() ? maximum() : static_cast<std::size_t>(workerCount_);
}

std::size_t Capacity::maximum() const noexcept {
    return static_cast<std::size_t>(workerCount_) * static_cast<std::size_t>(slotsPerWorker_);
}

bool Capacity::expand() noexcept {
    bool expected = false;
    if (!expanded_.compare_exchange_strong(expected, true)) {
        return false;
    }
    LOG_DEBUG("Capacity expanded: " + std::to_string(workerCount_) + " -> " + std::to_string(maximum()) + " slots");
    return true;
}

}
