/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "buildq/capacity.hpp"
#include "buildq/job.hpp"
#include "buildq/logger.hpp"
#include "buildq/pool.hpp"

namespace buildq {

// Observer hooks. Invoked synchronously on the thread that caused them,
// after the scheduler has released its lock, so they may query or enqueue.
// Calling drain() from a hook deadlocks.
struct SchedulerEvents {
    std::function<void(const std::string& name, std::size_t queueSize)> onEnqueued;
    std::function<void(const std::string& name, std::size_t active, std::size_t capacity)> onStarted;
    std::function<void(const std::string& name, LogLevel level, const std::string& message)> onLog;
    std::function<void(std::size_t capacity)> onCapacityChange;
    std::function<void()> onIdle;
};

struct SchedulerOptions {
    int workerCount = 4;
    int subprocessSlotsPerWorker = 2;
    // Null means silent. Called outside the scheduler lock, same rules as
    // SchedulerEvents.
    std::shared_ptr<LogSink> logger;
    SchedulerEvents events;
};

// Runs jobs in strict enqueue order with at most currentCapacity() of them
// in flight. Every state transition happens under one mutex; workers only
// re-enter through settle(). Log lines and hooks produced by a transition
// are delivered once the lock is dropped.
class Scheduler final {
public:
    // Throws ConfigError on non-positive counts or an oversized product.
    explicit Scheduler(SchedulerOptions options = {});
    // Waits for all submitted jobs before stopping the workers.
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    // Never blocks. Throws ConfigError if job.execute is empty; an empty
    // name is replaced by "job-<n>".
    JobHandle enqueue(Job job);

    // Blocks until no job is pending or running and every log line and
    // hook for them has been delivered. Must not be called from inside a
    // job, a hook or the log sink.
    void drain();

    // Settled jobs in settlement order.
    [[nodiscard]] std::vector<JobResult> results() const;

    [[nodiscard]] std::size_t currentCapacity() const noexcept { return capacity_.current(); }
    [[nodiscard]] std::size_t maxCapacity() const noexcept { return capacity_.maximum(); }
    // Worker threads currently owned; grows to maxCapacity() on expand().
    [[nodiscard]] int threadCount() const noexcept { return pool_.workerCount(); }

    // Switches to workerCount * subprocessSlotsPerWorker slots and fills
    // them from the queue. Idempotent; returns the capacity now in effect.
    std::size_t expand();

    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] std::size_t runningCount() const;
    [[nodiscard]] bool idle() const;

private:
    struct JobRecord;
    class JobReporter;
    using Outbox = std::vector<std::function<void()>>;

    void dispatchLocked(Outbox& outbox);
    void run(const std::shared_ptr<JobRecord>& record);
    void settle(const std::shared_ptr<JobRecord>& record, JobStatus status, JobValue value,
                std::string error, std::vector<std::string> records, std::exception_ptr failure);
    void settleLocked(const std::shared_ptr<JobRecord>& record, JobStatus status, JobValue value,
                      std::string error, std::vector<std::string> records, std::exception_ptr failure,
                      Outbox& outbox);
    void queueIdleLocked(Outbox& outbox);
    void deliver(Outbox& outbox);
    // Appends to the job's log; emits now when outbox is null.
    void logLine(JobRecord& record, LogLevel level, const std::string& message, Outbox* outbox);

    Capacity capacity_;
    std::shared_ptr<LogSink> sink_;
    SchedulerEvents events_;

    mutable std::mutex mutex_;
    std::condition_variable idleCondition_;
    std::deque<std::shared_ptr<JobRecord>> pending_;
    std::map<std::uint64_t, std::shared_ptr<JobRecord>> running_;
    std::vector<JobResult> results_;
    std::uint64_t nextSequence_ = 0;
    std::uint64_t nextStart_ = 0;
    std::uint64_t anonymousJobs_ = 0;
    std::size_t deliveries_ = 0;

    Pool pool_;
};

}
