/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/manifest.hpp"
#include "buildq/logger.hpp"
#include "text.hpp"
#include <algorithm>
#include <iterator>
#include <fstream>
#include <unordered_set>

namespace buildq {

namespace {

ManifestResult failure(std::size_t line, const std::string& message) {
    ManifestResult result;
    result.message = "line " + std::to_string(line) + ": " + message;
    return result;
}

}

std::vector<ManifestEntry> Manifest::regular() const {
    std::vector<ManifestEntry> out;
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(out),
                 [](const ManifestEntry& e) { return !e.deferred; });
    return out;
}

std::vector<ManifestEntry> Manifest::deferred() const {
    std::vector<ManifestEntry> out;
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(out),
                 [](const ManifestEntry& e) { return e.deferred; });
    return out;
}

ManifestResult parseManifest(std::istream& in) {
    ManifestResult result;
    std::unordered_set<std::string> seen;
    std::string raw;
    std::size_t lineNo = 0;

    while (std::getline(in, raw)) {
        ++lineNo;
        const std::string line = trimCopy(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return failure(lineNo, "expected 'name: command'");
        }

        ManifestEntry entry;
        entry.line = lineNo;
        entry.name = trimCopy(line.substr(0, colon));
        entry.command = trimCopy(line.substr(colon + 1));

        if (!entry.name.empty() && entry.name.front() == '!') {
            entry.deferred = true;
            entry.name = trimCopy(entry.name.substr(1));
        }
        if (entry.name.empty()) {
            return failure(lineNo, "missing job name");
        }
        if (entry.command.empty()) {
            return failure(lineNo, "missing command for '" + entry.name + "'");
        }
        if (!seen.insert(entry.name).second) {
            return failure(lineNo, "duplicate job name '" + entry.name + "'");
        }

        result.manifest.entries.push_back(std::move(entry));
    }

    if (in.bad()) {
        result.message = "read error after line " + std::to_string(lineNo);
        return result;
    }

    LOG_DEBUG("Manifest parsed: " + std::to_string(result.manifest.entries.size()) + " job(s)");
    result.ok = true;
    return result;
}

ManifestResult loadManifest(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        ManifestResult result;
        result.message = "cannot open manifest: " + path.string();
        return result;
    }
    ManifestResult result = parseManifest(file);
    if (!result) {
        result.message = path.string() + ": " + result.message;
    }
    return result;
}

ManifestResult selectEntries(const Manifest& manifest, const std::vector<std::string>& names) {
    ManifestResult result;
    std::unordered_set<std::string> wanted(names.begin(), names.end());

    for (const auto& name : names) {
        auto it = std::find_if(manifest.entries.begin(), manifest.entries.end(),
                               [&](const ManifestEntry& e) { return e.name == name; });
        if (it == manifest.entries.end()) {
            result.message = "unknown job '" + name + "'";
            return result;
        }
    }

    for (const auto& entry : manifest.entries) {
        if (wanted.count(entry.name)) {
            result.manifest.entries.push_back(entry);
        }
    }
    result.ok = true;
    return result;
}

}
