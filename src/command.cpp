/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/command.hpp"
#include "buildq/logger.hpp"
#include "text.hpp"
#include <array>
#include <cctype>
#include <cstdio>
#include <deque>
#include <string>
#include <utility>
#include <sys/wait.h>

namespace buildq {

namespace {

bool isWarningLine(const std::string& line) {
    static const std::string prefix = "warning:";
    if (line.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

int decodeStatus(int raw) {
    if (raw == -1) {
        return -1;
    }
    if (WIFEXITED(raw)) {
        return WEXITSTATUS(raw);
    }
    if (WIFSIGNALED(raw)) {
        return 128 + WTERMSIG(raw);
    }
    return -1;
}

}

CommandOutcome runCommand(const std::string& command, Reporter& reporter, std::size_t tailLines) {
    CommandOutcome outcome;

    FILE* pipe = popen((command + " 2>&1").c_str(), "r");
    if (!pipe) {
        LOG_ERROR("Failed to spawn: " + command);
        return outcome;
    }
    outcome.spawned = true;

    std::deque<std::string> tail;
    auto consume = [&](std::string line) {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        outcome.output += line;
        outcome.output += '\n';

        const std::string trimmed = trimCopy(line);
        if (trimmed.empty()) {
            return;
        }
        reporter.report(Progress{isWarningLine(trimmed) ? LogLevel::WARN : LogLevel::INFO, trimmed});
        tail.push_back(trimmed);
        if (tail.size() > tailLines) {
            tail.pop_front();
        }
    };

    std::array<char, 4096> buf;
    std::string partial;
    while (fgets(buf.data(), static_cast<int>(buf.size()), pipe)) {
        partial += buf.data();
        if (!partial.empty() && partial.back() == '\n') {
            consume(std::move(partial));
            partial.clear();
        }
    }
    if (!partial.empty()) {
        consume(std::move(partial));
    }

    outcome.exitStatus = decodeStatus(pclose(pipe));
    outcome.tail.assign(tail.begin(), tail.end());
    return outcome;
}

Job commandJob(std::string name, std::string command, std::size_t tailLines) {
    Job job;
    job.name = std::move(name);
    job.execute = [command = std::move(command), tailLines](Reporter& reporter) -> JobValue {
        reporter.report("$ " + command);
        CommandOutcome outcome = runCommand(command, reporter, tailLines);
        if (!outcome.spawned) {
            throw JobError("failed to start: " + command);
        }
        if (outcome.exitStatus != 0) {
            throw JobError(command + " exited with status " + std::to_string(outcome.exitStatus),
                           std::move(outcome.tail));
        }
        return trimCopy(outcome.output);
    };
    return job;
}

}
