/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "upcast/adapter.hpp"
#include "upcast/config.hpp"
#include "upcast/handle.hpp"
#include "upcast/queue.hpp"
#include "upcast/types.hpp"

namespace upcast {

class Pool;
struct UploadTask;

struct DispatchResult {
    bool ok = false;
    UploadHandle handle;
    ErrorCode error = ErrorCode::None;
    std::string message;

    explicit operator bool() const noexcept { return ok; }
};

// Drives queued jobs through the platform adapters on a bounded worker pool.
// All state changes go through the QueueManager.
class Orchestrator final {
public:
    Orchestrator(QueueManager& queue, const AdapterRegistry& registry, const Settings& settings);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    [[nodiscard]] bool start();
    // Cancels live handles, joins workers and fails anything never started.
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] DispatchResult uploadOne(JobId id);
    // Every pending job, admitted in queue order. Jobs that cannot be admitted
    // are skipped with a warning.
    [[nodiscard]] DispatchResult uploadAll();
    [[nodiscard]] DispatchResult retry(JobId id, const PlatformId& platform);

private:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] DispatchResult notRunning() const;
    std::shared_ptr<HandleState> newHandle();
    void dispatch(JobId id, const std::shared_ptr<HandleState>& handle, Clock::time_point notBefore);
    void process(const UploadTask& task, int workerId);
    void settle(const UploadTask& task, TaskStatus status, const std::string& detail);

    QueueManager& queue_;
    const AdapterRegistry& registry_;
    Settings settings_;

    std::atomic<bool> running_{false};
    std::unique_ptr<Pool> pool_;

    std::mutex handlesMutex_;
    std::vector<std::weak_ptr<HandleState>> handles_;
};

// Detail recorded on a failed task for an unsuccessful adapter result.
[[nodiscard]] std::string failureDetail(ErrorCode error, const std::string& message);

}
