/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "upcast/types.hpp"

namespace upcast {

struct TaskProgress {
    JobId job = 0;
    PlatformId platform;
    TaskStatus status = TaskStatus::Queued;
    double progress = 0.0;
    std::optional<std::string> detail;
};

using ProgressListener = std::function<void(const TaskProgress&)>;

// Shared between an UploadHandle and the workers running its tasks.
class HandleState {
public:
    using Clock = std::chrono::steady_clock;

    HandleState() = default;
    HandleState(const HandleState&) = delete;
    HandleState& operator=(const HandleState&) = delete;

    // Must be called for every task before any of them is submitted.
    void track(JobId job, const PlatformId& platform);
    void setStatus(JobId job, const PlatformId& platform, TaskStatus status,
                   const std::optional<std::string>& detail = std::nullopt);
    void setProgress(JobId job, const PlatformId& platform, double fraction);

    void cancel() noexcept;
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }
    // Sleeps until `when`; returns false early if cancelled.
    [[nodiscard]] bool sleepUntil(Clock::time_point when) const;

    [[nodiscard]] bool done() const;
    void wait() const;
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;

    [[nodiscard]] std::vector<TaskProgress> snapshot() const;
    [[nodiscard]] std::vector<JobId> jobs() const;
    void subscribe(ProgressListener listener);

private:
    using Key = std::pair<JobId, PlatformId>;

    void publish(const TaskProgress& update) const;

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::map<Key, TaskProgress> tasks_;
    std::vector<JobId> jobs_;
    std::size_t remaining_ = 0;
    std::atomic<bool> cancelled_{false};
    std::vector<ProgressListener> listeners_;
};

// Caller-side view of a dispatched batch. Copies share the same state.
// A default-constructed handle tracks nothing and is already done.
class UploadHandle {
public:
    UploadHandle();
    explicit UploadHandle(std::shared_ptr<HandleState> state) noexcept;

    [[nodiscard]] bool done() const;
    void wait() const;
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;

    void cancel() noexcept;
    [[nodiscard]] bool cancelled() const noexcept;

    [[nodiscard]] std::vector<TaskProgress> snapshot() const;
    [[nodiscard]] std::vector<JobId> jobs() const;
    // Listener runs on worker threads; it is not replayed for past updates.
    void subscribe(ProgressListener listener);

    [[nodiscard]] std::size_t failedCount() const;

private:
    std::shared_ptr<HandleState> state_;
};

}
