/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/build.hpp"
#include "buildq/command.hpp"
#include "buildq/logger.hpp"
#include "buildq/scheduler.hpp"
#include "buildq/types.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace buildq {

namespace {

class Palette {
public:
    explicit Palette(bool enabled) noexcept : enabled_(enabled) {}
    const char* operator()(const char* code) const noexcept { return enabled_ ? code : ""; }

private:
    bool enabled_;
};

std::string seconds(std::chrono::milliseconds duration) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (static_cast<double>(duration.count()) / 1000.0) << "s";
    return oss.str();
}

// Per-job lines, colored by level.
class TerminalSink final : public LogSink {
public:
    TerminalSink(std::ostream& stream, Palette color) : stream_(stream), color_(color) {}

    void info(const std::string& msg) override { write("\033[36m", msg); }
    void warn(const std::string& msg) override { write("\033[33m", msg); }
    void error(const std::string& msg) override { write("\033[31m", msg); }

private:
    void write(const char* code, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_ << color_(code) << msg << color_("\033[0m") << "\n" << std::flush;
    }

    std::ostream& stream_;
    Palette color_;
    std::mutex mutex_;
};

void runStage(Scheduler& scheduler, const std::vector<ManifestEntry>& entries) {
    std::vector<JobHandle> handles;
    handles.reserve(entries.size());
    for (const auto& entry : entries) {
        handles.push_back(scheduler.enqueue(commandJob(entry.name, entry.command)));
    }
    // Failures surface through results(); the handles only pace the run.
    for (const auto& handle : handles) {
        handle.wait();
    }
    scheduler.drain();
}

int printSummary(const std::vector<JobResult>& summary, std::ostream& out, Palette color) {
    out << color("\033[1m\033[36m") << "Build Summary" << color("\033[0m") << "\n";

    std::size_t failures = 0;
    for (const auto& entry : summary) {
        if (entry.ok()) {
            out << "  " << color("\033[32m") << "ok" << color("\033[0m") << "      "
                << entry.name << " built in " << seconds(entry.duration) << "\n";
            continue;
        }

        ++failures;
        out << "  " << color("\033[31m") << "failed" << color("\033[0m") << "  "
            << entry.name << " failed after " << seconds(entry.duration) << "\n";
        if (!entry.error.empty()) {
            out << "          " << entry.error << "\n";
        }
        const std::size_t tail = std::min<std::size_t>(entry.logs.size(), kDefaultTailLines);
        if (tail > 0) {
            out << "  --- " << entry.name << " log tail ---\n";
            for (auto it = entry.logs.end() - static_cast<std::ptrdiff_t>(tail); it != entry.logs.end(); ++it) {
                out << "  " << *it << "\n";
            }
            out << "  --- end " << entry.name << " ---\n";
        }
    }

    if (failures == 0) {
        out << color("\033[32m") << "All builds completed successfully." << color("\033[0m") << "\n";
        return 0;
    }
    out << color("\033[31m") << failures << " build(s) failed. Review logs above for details."
        << color("\033[0m") << "\n";
    return 1;
}

}

int runManifest(const Manifest& manifest, const BuildConfig& config, const BuildRequest& request,
                std::ostream& out, std::ostream& err) {
    const Palette color(request.color);

    Manifest selected = manifest;
    if (!request.only.empty()) {
        ManifestResult picked = selectEntries(manifest, request.only);
        if (!picked) {
            err << "Error: " << picked.message << "\n";
            return 1;
        }
        selected = std::move(picked.manifest);
    }
    if (selected.empty()) {
        err << "Error: No jobs selected for build.\n";
        return 2;
    }

    try {
        SchedulerOptions options;
        options.workerCount = config.workerThreads;
        options.subprocessSlotsPerWorker = config.subprocessesPerWorker;
        if (!request.quiet) {
            options.logger = std::make_shared<TerminalSink>(err, color);
        }
        Scheduler scheduler(options);

        if (!request.quiet) {
            out << "Build worker pool: " << config.workerThreads << " thread(s), up to "
                << scheduler.maxCapacity() << " concurrent jobs (subprocess limit "
                << config.subprocessesPerWorker << ").\n";
        }
        if (request.maxCapacity) {
            scheduler.expand();
        }

        const auto regular = selected.regular();
        const auto deferred = selected.deferred();

        runStage(scheduler, regular);

        if (!deferred.empty()) {
            const std::size_t capacity = scheduler.expand();
            if (!request.quiet) {
                out << deferred.size() << " deferred job(s) "
                    << (regular.empty() ? "scheduled" : "queued after the others")
                    << " with expanded pool size " << capacity << ".\n";
            }
            runStage(scheduler, deferred);
        }

        const auto summary = scheduler.results();
        if (summary.empty()) {
            err << "Error: No builds were executed.\n";
            return 2;
        }
        return printSummary(summary, out, color);

    } catch (const ConfigError& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Build run failed: " + std::string(e.what()));
        return 1;
    }
}

}
