/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/scheduler.hpp"
#include "buildq/logger.hpp"
#include "text.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace buildq {

namespace {

// Hook failures are logged, never propagated into the dispatcher.
template <typename Fn, typename... Args>
void invokeHook(const char* hook, const Fn& fn, Args&&... args) noexcept {
    if (!fn) {
        return;
    }
    try {
        fn(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        LOG_WARN(std::string(hook) + " hook threw: " + e.what());
    } catch (...) {
        LOG_WARN(std::string(hook) + " hook threw a non-standard exception");
    }
}

}

struct Scheduler::JobRecord {
    std::uint64_t sequence = 0;
    Job job;
    JobState state = JobState::Pending;
    std::promise<JobValue> promise;
    std::uint64_t startSequence = 0;
    std::chrono::steady_clock::time_point startedAt;
    std::chrono::steady_clock::time_point finishedAt;

    std::mutex logMutex;
    std::vector<std::string> logs;
};

class Scheduler::JobReporter final : public Reporter {
public:
    JobReporter(Scheduler& scheduler, JobRecord& record) noexcept
        : scheduler_(scheduler), record_(record) {}

private:
    void emit(const Progress& progress) override {
        scheduler_.logLine(record_, progress.level, progress.message, nullptr);
    }

    Scheduler& scheduler_;
    JobRecord& record_;
};

Scheduler::Scheduler(SchedulerOptions options)
    : capacity_(options.workerCount, options.subprocessSlotsPerWorker),
      sink_(options.logger ? std::move(options.logger) : std::shared_ptr<LogSink>(std::make_shared<NullLogSink>())),
      events_(std::move(options.events)),
      pool_(capacity_.workerCount()) {
    if (!pool_.start()) {
        throw std::runtime_error("Failed to start scheduler worker pool");
    }
    LOG_DEBUG("Scheduler created - workers: " + std::to_string(capacity_.workerCount()) +
              ", subprocess slots per worker: " + std::to_string(capacity_.subprocessSlotsPerWorker()) +
              ", max capacity: " + std::to_string(capacity_.maximum()));
}

Scheduler::~Scheduler() {
    drain();
    pool_.stop();
}

JobHandle Scheduler::enqueue(Job job) {
    if (!job.execute) {
        throw ConfigError("enqueue requires an execute function" +
                          (job.name.empty() ? std::string() : " (job: " + job.name + ")"));
    }

    auto record = std::make_shared<JobRecord>();
    JobHandle handle = record->promise.get_future().share();

    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job.name.empty()) {
            job.name = "job-" + std::to_string(++anonymousJobs_);
        }
        record->sequence = nextSequence_++;
        record->job = std::move(job);

        pending_.push_back(record);
        LOG_DEBUG("Job queued: " + record->job.name + " (pending " + std::to_string(pending_.size()) + ")");
        if (events_.onEnqueued) {
            const std::string name = record->job.name;
            const std::size_t queued = pending_.size();
            outbox.emplace_back([this, name, queued] {
                invokeHook("onEnqueued", events_.onEnqueued, name, queued);
            });
        }

        dispatchLocked(outbox);
        ++deliveries_;
    }
    deliver(outbox);
    return handle;
}

void Scheduler::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    idleCondition_.wait(lock, [this] {
        return pending_.empty() && running_.empty() && deliveries_ == 0;
    });
}

std::vector<JobResult> Scheduler::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

std::size_t Scheduler::expand() {
    Outbox outbox;
    std::size_t capacity = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!capacity_.expanded()) {
            // Threads first: a slot without a thread would sit in the pool queue.
            if (!pool_.grow(static_cast<int>(capacity_.maximum()))) {
                LOG_WARN("Scheduler running with " + std::to_string(pool_.workerCount()) +
                         " worker thread(s) after failed growth");
            }
        }
        const bool changed = capacity_.expand();
        capacity = capacity_.current();
        if (changed) {
            LOG_DEBUG("Scheduler capacity now " + std::to_string(capacity));
            if (events_.onCapacityChange) {
                outbox.emplace_back([this, capacity] {
                    invokeHook("onCapacityChange", events_.onCapacityChange, capacity);
                });
            }
            dispatchLocked(outbox);
        }
        ++deliveries_;
    }
    deliver(outbox);
    return capacity;
}

std::size_t Scheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::size_t Scheduler::runningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.size();
}

bool Scheduler::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.empty() && running_.empty();
}

void Scheduler::dispatchLocked(Outbox& outbox) {
    bool settledInline = false;

    // Capacity is re-read every iteration so an expansion reaches jobs
    // that were already queued.
    while (running_.size() < capacity_.current() && !pending_.empty()) {
        std::shared_ptr<JobRecord> record = std::move(pending_.front());
        pending_.pop_front();

        record->state = JobState::Running;
        record->startedAt = std::chrono::steady_clock::now();
        record->startSequence = nextStart_++;
        running_.emplace(record->sequence, record);

        const std::size_t active = running_.size();
        const std::size_t capacity = capacity_.current();
        logLine(*record, LogLevel::INFO,
                "started (active " + std::to_string(active) + "/" + std::to_string(capacity) + ")", &outbox);
        if (events_.onStarted) {
            const std::string name = record->job.name;
            outbox.emplace_back([this, name, active, capacity] {
                invokeHook("onStarted", events_.onStarted, name, active, capacity);
            });
        }

        if (!pool_.submit([this, record](int) { run(record); })) {
            const std::string reason = "worker pool unavailable";
            settleLocked(record, JobStatus::Rejected, JobValue(), reason, {},
                         std::make_exception_ptr(std::runtime_error(reason)), outbox);
            settledInline = true;
        }
    }

    if (settledInline) {
        queueIdleLocked(outbox);
    }
}

void Scheduler::run(const std::shared_ptr<JobRecord>& record) {
    JobReporter reporter(*this, *record);

    JobStatus status = JobStatus::Fulfilled;
    JobValue value;
    std::string error;
    std::vector<std::string> records;
    std::exception_ptr failure;

    try {
        value = record->job.execute(reporter);
    } catch (const JobError& e) {
        status = JobStatus::Rejected;
        error = e.what();
        records = e.records();
        failure = std::current_exception();
    } catch (const std::exception& e) {
        status = JobStatus::Rejected;
        error = e.what();
        failure = std::current_exception();
    } catch (...) {
        status = JobStatus::Rejected;
        failure = std::current_exception();
    }

    if (status == JobStatus::Rejected && error.empty()) {
        error = "Unknown error";
    }

    settle(record, status, std::move(value), std::move(error), std::move(records), failure);
}

void Scheduler::settle(const std::shared_ptr<JobRecord>& record, JobStatus status, JobValue value,
                       std::string error, std::vector<std::string> records, std::exception_ptr failure) {
    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settleLocked(record, status, std::move(value), std::move(error), std::move(records), failure, outbox);
        dispatchLocked(outbox);
        queueIdleLocked(outbox);
        ++deliveries_;
    }
    deliver(outbox);
}

void Scheduler::settleLocked(const std::shared_ptr<JobRecord>& record, JobStatus status, JobValue value,
                             std::string error, std::vector<std::string> records,
                             std::exception_ptr failure, Outbox& outbox) {
    record->finishedAt = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        record->finishedAt - record->startedAt);
    const auto duration = std::max(elapsed, std::chrono::milliseconds(0));

    if (status == JobStatus::Fulfilled) {
        record->state = JobState::Fulfilled;
        logLine(*record, LogLevel::INFO, "completed in " + std::to_string(duration.count()) + "ms", &outbox);
    } else {
        record->state = JobState::Rejected;
        logLine(*record, LogLevel::ERROR,
                "failed after " + std::to_string(duration.count()) + "ms: " + error, &outbox);
        for (const auto& line : records) {
            logLine(*record, LogLevel::ERROR, trimCopy(line), &outbox);
        }
    }

    JobResult result;
    result.name = record->job.name;
    result.startSequence = record->startSequence;
    result.status = status;
    result.value = value;
    result.error = error;
    result.records = records;
    result.startedAt = record->startedAt;
    result.finishedAt = record->finishedAt;
    result.duration = duration;
    {
        std::lock_guard<std::mutex> logLock(record->logMutex);
        result.logs = record->logs;
    }
    results_.push_back(std::move(result));
    running_.erase(record->sequence);

    // Handles complete before drain() can observe the idle state.
    if (status == JobStatus::Fulfilled) {
        record->promise.set_value(std::move(value));
    } else {
        record->promise.set_exception(failure ? failure
                                              : std::make_exception_ptr(JobError(error, std::move(records))));
    }
}

void Scheduler::queueIdleLocked(Outbox& outbox) {
    if (!pending_.empty() || !running_.empty()) {
        return;
    }
    LOG_DEBUG("Scheduler idle after " + std::to_string(results_.size()) + " settled job(s)");
    if (events_.onIdle) {
        outbox.emplace_back([this] { invokeHook("onIdle", events_.onIdle); });
    }
}

void Scheduler::deliver(Outbox& outbox) {
    for (auto& send : outbox) {
        send();
    }
    outbox.clear();

    // Notified under the lock: drain() may return and destroy *this as
    // soon as deliveries_ reaches zero.
    std::lock_guard<std::mutex> lock(mutex_);
    --deliveries_;
    if (pending_.empty() && running_.empty() && deliveries_ == 0) {
        idleCondition_.notify_all();
    }
}

void Scheduler::logLine(JobRecord& record, LogLevel level, const std::string& message, Outbox* outbox) {
    if (message.empty()) {
        return;
    }
    const std::string text = "[" + record.job.name + "] " + message;
    {
        std::lock_guard<std::mutex> lock(record.logMutex);
        record.logs.push_back(text);
    }

    auto send = [this, level, text, name = record.job.name, message] {
        try {
            switch (level) {
                case LogLevel::ERROR: sink_->error(text); break;
                case LogLevel::WARN:  sink_->warn(text); break;
                default:              sink_->info(text); break;
            }
        } catch (const std::exception& e) {
            LOG_WARN("Log sink threw: " + std::string(e.what()));
        } catch (...) {
            LOG_WARN("Log sink threw a non-standard exception");
        }
        invokeHook("onLog", events_.onLog, name, level, message);
    };

    if (outbox) {
        outbox->push_back(std::move(send));
    } else {
        send();
    }
}

}
