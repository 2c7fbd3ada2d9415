/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "buildq/config.hpp"
#include "buildq/manifest.hpp"

namespace buildq {

struct BuildRequest {
    // Job names to keep; empty runs the whole manifest.
    std::vector<std::string> only;
    bool maxCapacity = false;
    bool quiet = false;
    bool color = false;
};

// Runs the manifest's regular jobs, then its deferred ones with expanded
// capacity, and prints the summary to `out`. Job log lines and errors go
// to `err`.
// Returns 0 when every job succeeded, 1 when a job failed or the request
// is invalid, 2 when nothing was selected to build.
int runManifest(const Manifest& manifest, const BuildConfig& config, const BuildRequest& request,
                std::ostream& out, std::ostream& err);

}
