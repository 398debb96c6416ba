/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "upcast/handle.hpp"
#include "upcast/types.hpp"

namespace upcast {

// One platform upload waiting for a worker.
struct UploadTask {
    JobId job = 0;
    PlatformId platform;
    std::shared_ptr<HandleState> handle;
    // Admission pacing; the worker holds the task until then
    std::chrono::steady_clock::time_point notBefore{};
};

using TaskProcessor = std::function<void(const UploadTask&, int workerId)>;

// Fixed set of workers draining a FIFO; the worker count is the upload
// concurrency cap.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(TaskProcessor processor);
    // Joins workers after their current task; queued tasks stay for drain().
    void stop() noexcept;
    // False once stop() has begun; an accepted task is either run by a
    // worker or returned by drain().
    [[nodiscard]] bool submit(UploadTask task);
    [[nodiscard]] std::vector<UploadTask> drain();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;

private:
    void workerLoop(int workerId);

    int workers_;
    TaskProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable taskAvailable_;
    std::deque<UploadTask> taskQueue_;

    std::vector<std::thread> workerThreads_;
};

}
