/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "buildq/pool.hpp"
#include "buildq/logger.hpp"
#include <string>

namespace buildq {

Pool::Pool(int workers) noexcept : workers_(workers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start() {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    const int workers = workers_.load();
    if (workers < 1) {
        LOG_ERROR("Pool needs at least one worker (got " + std::to_string(workers) + ")");
        return false;
    }

    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers);
        for (int i = 0; i < workers; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        
        LOG_DEBUG("Pool started with " + std::to_string(workers) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    
    // Wake up all waiting threads
    taskAvailable_.notify_all();
    
    // Wait for all threads to finish
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    
    workerThreads_.clear();
    
    // Drop tasks nobody picked up
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = taskQueue_.size();
        while (!taskQueue_.empty()) {
            taskQueue_.pop();
        }
    }
    if (dropped > 0) {
        LOG_WARN("Pool stopped with " + std::to_string(dropped) + " unclaimed task(s)");
    }
    
    LOG_DEBUG("Pool stopped");
}

bool Pool::submit(Task task) noexcept {
    if (!task) {
        LOG_ERROR("Refusing to queue empty task");
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load() || shutdown_.load()) {
                LOG_DEBUG("Cannot submit task to stopped pool");
                return false;
            }
            taskQueue_.push(std::move(task));
        }
        
        taskAvailable_.notify_one();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue task: " + std::string(e.what()));
        return false;
    }
}

bool Pool::grow(int workers) {
    if (!running_.load() || shutdown_.load()) {
        LOG_WARN("Cannot grow a stopped pool");
        return false;
    }

    std::lock_guard<std::mutex> lock(queueMutex_);
    const int before = static_cast<int>(workerThreads_.size());
    try {
        for (int i = before; i < workers; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to grow pool: " + std::string(e.what()));
        workers_.store(static_cast<int>(workerThreads_.size()));
        return false;
    }
    workers_.store(static_cast<int>(workerThreads_.size()));
    if (workers > before) {
        LOG_DEBUG("Pool grew from " + std::to_string(before) + " to " + std::to_string(workers) + " worker threads");
    }
    return true;
}

std::size_t Pool::queueSize() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return taskQueue_.size();
    } catch (...) {
        return 0;
    }
}

void Pool::workerLoop(int workerId) {
    // Name this thread for logging
    setThreadName(getThreadName(workerId));
    LOG_TRACE(getThreadName(workerId) + " thread started");
    
    while (true) {
        Task task;
        
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            
            // Wait for a task or shutdown signal
            taskAvailable_.wait(lock, [this] { 
                return !taskQueue_.empty() || shutdown_.load(); 
            });
            
            if (shutdown_.load()) {
                break;
            }
            
            task = std::move(taskQueue_.front());
            taskQueue_.pop();
        }
        
        // Run outside of lock
        try {
            task(workerId);
        } catch (const std::exception& e) {
            LOG_ERROR(getThreadName(workerId) + " task error: " + std::string(e.what()));
        } catch (...) {
            LOG_ERROR(getThreadName(workerId) + " unknown task error");
        }
    }
    
    LOG_TRACE(getThreadName(workerId) + " stopped");
}

}
