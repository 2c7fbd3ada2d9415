/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "buildq/job.hpp"

namespace buildq {

constexpr std::size_t kDefaultTailLines = 10;

struct CommandOutcome {
    bool spawned = false;
    int exitStatus = -1;      // 128 + signal when killed
    std::string output;       // stdout and stderr, merged
    std::vector<std::string> tail;
};

// Runs `/bin/sh -c command`, forwarding every non-blank output line to the
// reporter as it arrives. Lines beginning with "warning:" go out at WARN.
[[nodiscard]] CommandOutcome runCommand(const std::string& command, Reporter& reporter,
                                        std::size_t tailLines = kDefaultTailLines);

// Job that fulfils with the command's trimmed output, or throws JobError
// carrying the output tail when the command fails.
[[nodiscard]] Job commandJob(std::string name, std::string command,
                             std::size_t tailLines = kDefaultTailLines);

}
