/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/build.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

using namespace buildq;

namespace {

class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "buildq-test-XXXXXX").string();
        if (mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

Manifest manifestOf(const std::string& text) {
    std::istringstream in(text);
    ManifestResult result = parseManifest(in);
    if (!result) {
        throw std::runtime_error(result.message);
    }
    return result.manifest;
}

BuildConfig config(int workers, int slots) {
    BuildConfig cfg;
    cfg.workerThreads = workers;
    cfg.subprocessesPerWorker = slots;
    return cfg;
}

// Touches `mine`, then succeeds only if `theirs` shows up within ~5s.
std::string rendezvous(const std::string& mine, const std::string& theirs) {
    return "touch " + mine + "; i=0; while [ $i -lt 100 ]; do [ -e " + theirs +
           " ] && exit 0; i=$((i+1)); sleep 0.05; done; exit 1";
}

struct Run {
    int status = 0;
    std::string out;
    std::string err;
};

Run build(const Manifest& manifest, const BuildConfig& cfg, const BuildRequest& request = {}) {
    std::ostringstream out;
    std::ostringstream err;
    Run run;
    run.status = runManifest(manifest, cfg, request, out, err);
    run.out = out.str();
    run.err = err.str();
    return run;
}

bool has(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

}

TEST(BuildTest, SucceedsWhenEveryJobSucceeds) {
    const auto run = build(manifestOf("moon: true\nwarden: echo compiled\n"), config(2, 2));

    EXPECT_EQ(run.status, 0);
    EXPECT_TRUE(has(run.out, "Build worker pool: 2 thread(s), up to 4 concurrent jobs (subprocess limit 2)."));
    EXPECT_TRUE(has(run.out, "moon built in "));
    EXPECT_TRUE(has(run.out, "warden built in "));
    EXPECT_TRUE(has(run.out, "All builds completed successfully."));
    EXPECT_TRUE(has(run.err, "[warden] compiled"));
}

TEST(BuildTest, FailsWhenAnyJobFails) {
    const auto run = build(manifestOf("moon: true\nbroken: echo 'error: missing jdk'; exit 3\n"), config(2, 1));

    EXPECT_EQ(run.status, 1);
    EXPECT_TRUE(has(run.out, "moon built in "));
    EXPECT_TRUE(has(run.out, "broken failed after "));
    EXPECT_TRUE(has(run.out, "exited with status 3"));
    EXPECT_TRUE(has(run.out, "--- broken log tail ---"));
    EXPECT_TRUE(has(run.out, "[broken] error: missing jdk"));
    EXPECT_TRUE(has(run.out, "1 build(s) failed."));
}

TEST(BuildTest, EmptyManifestBuildsNothing) {
    const auto run = build(manifestOf("# nothing here\n"), config(1, 1));

    EXPECT_EQ(run.status, 2);
    EXPECT_TRUE(has(run.err, "No jobs selected for build."));
    EXPECT_TRUE(run.out.empty());
}

TEST(BuildTest, RejectsUnknownSelection) {
    BuildRequest request;
    request.only = {"moon", "ghost"};
    const auto run = build(manifestOf("moon: true\n"), config(1, 1), request);

    EXPECT_EQ(run.status, 1);
    EXPECT_TRUE(has(run.err, "ghost"));
    EXPECT_TRUE(run.out.empty());
}

TEST(BuildTest, RunsOnlySelectedJobs) {
    BuildRequest request;
    request.only = {"warden"};
    request.quiet = true;
    const auto run = build(manifestOf("moon: false\nwarden: true\n"), config(1, 1), request);

    EXPECT_EQ(run.status, 0);
    EXPECT_TRUE(has(run.out, "warden built in "));
    EXPECT_FALSE(has(run.out, "moon"));
    EXPECT_FALSE(has(run.out, "Build worker pool"));
}

TEST(BuildTest, DeferredJobsRunAfterTheOthersWithExpandedPool) {
    TempDir dir;
    const std::string marker = dir.file("early-done");
    const auto manifest = manifestOf("early: sleep 0.2; touch " + marker + "\n"
                                     "!late: test -e " + marker + "\n");
    const auto run = build(manifest, config(2, 3));

    EXPECT_EQ(run.status, 0) << run.out << run.err;
    EXPECT_TRUE(has(run.out, "1 deferred job(s) queued after the others with expanded pool size 6."));
    EXPECT_LT(run.out.find("early built in "), run.out.find("late built in "));
}

TEST(BuildTest, DeferredJobsShareTheExpandedCapacity) {
    TempDir dir;
    const std::string a = dir.file("a");
    const std::string b = dir.file("b");
    // One worker: these two can only both finish if they run side by side.
    const auto manifest = manifestOf("!left: " + rendezvous(a, b) + "\n"
                                     "!right: " + rendezvous(b, a) + "\n");
    const auto run = build(manifest, config(1, 2));

    EXPECT_EQ(run.status, 0) << run.out << run.err;
    EXPECT_TRUE(has(run.out, "2 deferred job(s) scheduled with expanded pool size 2."));
}

TEST(BuildTest, MaxCapacityAppliesToRegularJobs) {
    TempDir dir;
    const std::string a = dir.file("a");
    const std::string b = dir.file("b");
    const auto manifest = manifestOf("left: " + rendezvous(a, b) + "\n"
                                     "right: " + rendezvous(b, a) + "\n");
    BuildRequest request;
    request.maxCapacity = true;
    const auto run = build(manifest, config(1, 2), request);

    EXPECT_EQ(run.status, 0) << run.out << run.err;
    EXPECT_TRUE(has(run.out, "left built in "));
    EXPECT_TRUE(has(run.out, "right built in "));
}

TEST(BuildTest, ColorIsOffUnlessRequested) {
    const auto run = build(manifestOf("moon: true\n"), config(1, 1));
    EXPECT_FALSE(has(run.out, "\033["));
    EXPECT_FALSE(has(run.err, "\033["));
}
