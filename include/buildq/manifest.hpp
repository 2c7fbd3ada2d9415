/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace buildq {

// One line of a manifest: `name: command`, or `!name: command` for a job
// that waits for the others and runs with expanded capacity.
struct ManifestEntry {
    std::string name;
    std::string command;
    bool deferred = false;
    std::size_t line = 0;
};

struct Manifest {
    std::vector<ManifestEntry> entries;

    [[nodiscard]] std::vector<ManifestEntry> regular() const;
    [[nodiscard]] std::vector<ManifestEntry> deferred() const;
    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }
};

struct ManifestResult {
    bool ok = false;
    Manifest manifest;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] ManifestResult parseManifest(std::istream& in);
[[nodiscard]] ManifestResult loadManifest(const std::filesystem::path& path);

// Keeps only the named entries, in manifest order. Unknown names fail.
[[nodiscard]] ManifestResult selectEntries(const Manifest& manifest, const std::vector<std::string>& names);

}
