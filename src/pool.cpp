/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/pool.hpp"
#include "upcast/logger.hpp"
#include <iterator>

namespace upcast {

namespace {
std::string describe(const UploadTask& task) {
    return "job " + std::to_string(task.job) + "/" + task.platform;
}
}

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(TaskProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid task processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_INFO("Pool started with " + std::to_string(workers_) + " upload workers");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        shutdown_.store(true);
        running_.store(false);
        taskAvailable_.notify_all();
        for (auto& thread : workerThreads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        workerThreads_.clear();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        // submit() reads both flags under this lock
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }

    taskAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerThreads_.clear();

    LOG_INFO("Pool stopped (" + std::to_string(queueSize()) + " task(s) left unclaimed)");
}

bool Pool::submit(UploadTask task) {
    std::string label = describe(task);
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load() || shutdown_.load()) {
            LOG_DEBUG("Cannot submit to stopped pool: " + label);
            return false;
        }
        taskQueue_.push_back(std::move(task));
    }

    taskAvailable_.notify_one();
    LOG_DEBUG("Task queued: " + label);
    return true;
}

std::vector<UploadTask> Pool::drain() {
    std::lock_guard<std::mutex> lock(queueMutex_);
    std::vector<UploadTask> remaining(std::make_move_iterator(taskQueue_.begin()),
                                      std::make_move_iterator(taskQueue_.end()));
    taskQueue_.clear();
    return remaining;
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return taskQueue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName("Worker-" + std::to_string(workerId));
    LOG_DEBUG("Worker-" + std::to_string(workerId) + " thread started");

    try {
        while (!shutdown_.load()) {
            UploadTask task;

            {
                std::unique_lock<std::mutex> lock(queueMutex_);

                taskAvailable_.wait(lock, [this] {
                    return !taskQueue_.empty() || shutdown_.load();
                });

                if (shutdown_.load()) {
                    break;
                }

                if (taskQueue_.empty()) {
                    continue;
                }

                task = std::move(taskQueue_.front());
                taskQueue_.pop_front();
            }

            LOG_DEBUG("Worker-" + std::to_string(workerId) + " claimed " + describe(task));

            try {
                processor_(task, workerId);
            } catch (const std::exception& e) {
                LOG_ERROR("Worker " + std::to_string(workerId) + " task error: " +
                          std::string(e.what()) + " (" + describe(task) + ")");
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Worker " + std::to_string(workerId) + " fatal error: " + std::string(e.what()));
    }

    LOG_DEBUG("Worker " + std::to_string(workerId) + " stopped");
}

}
