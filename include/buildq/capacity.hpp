/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstddef>

namespace buildq {

// Concurrency ceiling: one slot per worker until expanded, then
// workerCount * subprocessSlotsPerWorker. Expansion is one-way.
class Capacity final {
public:
    // Throws ConfigError unless both counts are positive and their product
    // fits in an int.
    Capacity(int workerCount, int subprocessSlotsPerWorker);

    Capacity(const Capacity&) = delete;
    Capacity& operator=(const Capacity&) = delete;

    [[nodiscard]] std::size_t current() const noexcept;
    [[nodiscard]] std::size_t maximum() const noexcept;
    [[nodiscard]] bool expanded() const noexcept { return expanded_.load(); }

    // Returns true if this call performed the transition.
    bool expand() noexcept;

    [[nodiscard]] int workerCount() const noexcept { return workerCount_; }
    [[nodiscard]] int subprocessSlotsPerWorker() const noexcept { return slotsPerWorker_; }

private:
    int workerCount_;
    int slotsPerWorker_;
    std::atomic<bool> expanded_{false};
};

}
