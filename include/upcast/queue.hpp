/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "upcast/adapter.hpp"
#include "upcast/job.hpp"
#include "upcast/types.hpp"

namespace upcast {

class JobStore;

enum class QueueEventKind : uint8_t { Added, Updated, Removed, Admitted, TaskChanged, Progress };

struct QueueEvent {
    QueueEventKind kind = QueueEventKind::Updated;
    JobId job = 0;
    JobStatus jobStatus = JobStatus::Pending;
    // Task fields are meaningful for TaskChanged and Progress only
    PlatformId platform;
    TaskStatus taskStatus = TaskStatus::Queued;
    double progress = 0.0;
    std::optional<std::string> detail;
};

using QueueListener = std::function<void(const QueueEvent&)>;

// Owns every Job and is the single writer of Job and PlatformTask state.
// The job map is guarded by one mutex; each job carries its own mutex so
// transitions on one job are serialized while other jobs proceed in parallel.
// Listeners run on the calling thread after all locks are released.
class QueueManager final {
public:
    explicit QueueManager(const AdapterRegistry& registry, JobStore* store = nullptr);

    QueueManager(const QueueManager&) = delete;
    QueueManager& operator=(const QueueManager&) = delete;
    QueueManager(QueueManager&&) = delete;
    QueueManager& operator=(QueueManager&&) = delete;

    // Restores persisted jobs; tasks left queued/uploading by a previous run
    // are settled as failed ("Interrupted"). Returns the number restored.
    std::size_t load();

    [[nodiscard]] AddResult add(const std::filesystem::path& path);
    [[nodiscard]] OpResult update(JobId id, const JobUpdate& fields);
    [[nodiscard]] OpResult remove(JobId id);

    [[nodiscard]] std::vector<Job> list() const;
    [[nodiscard]] std::optional<Job> get(JobId id) const;
    [[nodiscard]] std::vector<JobId> pending() const;
    [[nodiscard]] std::size_t size() const;

    // Creates one queued task per selected platform.
    [[nodiscard]] OpResult admit(JobId id);
    [[nodiscard]] OpResult transition(JobId id, const PlatformId& platform, TaskStatus next,
                                      const std::string& detail = "");
    [[nodiscard]] OpResult reportProgress(JobId id, const PlatformId& platform, double fraction);
    [[nodiscard]] OpResult retry(JobId id, const PlatformId& platform);

    std::size_t subscribe(QueueListener listener);
    void unsubscribe(std::size_t token);

private:
    struct Entry {
        std::mutex mutex;
        Job job;
        bool removed = false;
    };

    [[nodiscard]] std::shared_ptr<Entry> find(JobId id) const;
    void persist(const Job& job) const noexcept;
    void notify(const QueueEvent& event) const;
    [[nodiscard]] OpResult validatePlatforms(const std::set<PlatformId>& platforms) const;
    [[nodiscard]] static QueueEvent taskEvent(QueueEventKind kind, const Job& job, const PlatformTask& task);

    const AdapterRegistry& registry_;
    JobStore* store_;

    mutable std::mutex jobsMutex_;
    std::vector<std::shared_ptr<Entry>> order_;
    std::unordered_map<JobId, std::shared_ptr<Entry>> jobs_;
    JobId nextId_ = 1;

    mutable std::mutex listenersMutex_;
    std::vector<std::pair<std::size_t, QueueListener>> listeners_;
    std::size_t nextToken_ = 1;
};

}
