/*
 * buildq - Manifest build runner (buildq)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/build.hpp"
#include "buildq/config.hpp"
#include "buildq/logger.hpp"
#include "buildq/manifest.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

using namespace buildq;

constexpr const char* VERSION = "0.1.0";

namespace {

void printUsage(const char* progName) {
    std::cout << "buildq Manifest Build Runner v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] <manifest>\n";
    std::cout << "       " << progName << " [options] -     (read manifest from stdin)\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Manifest format (one job per line):\n";
    std::cout << "  name: command       run with one slot per worker\n";
    std::cout << "  !name: command      run after the others, with every slot available\n";
    std::cout << "  # comment\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --workers <n>        Worker threads (default " << kDefaultWorkerThreads << ")\n";
    std::cout << "  -s, --subprocesses <n>   Subprocess slots per worker (default "
              << kDefaultSubprocessesPerWorker << ")\n";
    std::cout << "  --max-capacity           Use every slot from the start\n";
    std::cout << "  --only <a,b,...>         Run only the named jobs\n";
    std::cout << "  -q, --quiet              Only print the summary\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  -v, --version            Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  BUILDQ_WORKERS        Worker threads\n";
    std::cout << "  BUILDQ_SUBPROCESSES   Subprocess slots per worker\n";
    std::cout << "  BUILDQ_LOG_LEVEL      Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " services.txt\n";
    std::cout << "  " << progName << " -w 2 -s 4 --only moon,raven services.txt\n";
}

std::vector<std::string> splitNames(const std::string& list) {
    std::vector<std::string> names;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            names.push_back(item);
        }
    }
    return names;
}

}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    std::optional<std::string> workersFlag;
    std::optional<std::string> subprocessesFlag;
    std::vector<std::string> only;
    std::string manifestPath;
    bool maxCapacity = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--workers") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return 1;
            }
            workersFlag = argv[++i];
        } else if (arg == "-s" || arg == "--subprocesses") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return 1;
            }
            subprocessesFlag = argv[++i];
        } else if (arg == "--only") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --only requires a list of job names\n";
                return 1;
            }
            only = splitNames(argv[++i]);
        } else if (arg == "--max-capacity") {
            maxCapacity = true;
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        } else if (manifestPath.empty()) {
            manifestPath = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (manifestPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    // Quiet keeps stderr to warnings; BUILDQ_LOG_LEVEL still wins
    if (quiet && !std::getenv("BUILDQ_LOG_LEVEL")) {
        Logger::setLevel(LogLevel::WARN);
    }
    setThreadName("Main");

    ManifestResult loaded = manifestPath == "-" ? parseManifest(std::cin) : loadManifest(manifestPath);
    if (!loaded) {
        std::cerr << "Error: " << loaded.message << "\n";
        return 1;
    }

    BuildRequest request;
    request.only = std::move(only);
    request.maxCapacity = maxCapacity;
    request.quiet = quiet;
    request.color = isatty(fileno(stdout)) != 0;

    return runManifest(loaded.manifest, resolveBuildConfig(workersFlag, subprocessesFlag), request,
                       std::cout, std::cerr);
}
