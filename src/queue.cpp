/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/queue.hpp"
#include "upcast/logger.hpp"
#include "upcast/store.hpp"
#include <algorithm>

namespace upcast {

namespace {
constexpr const char* kInterruptedDetail = "Interrupted";

std::string jobLabel(JobId id) {
    return "job " + std::to_string(id);
}
}

QueueManager::QueueManager(const AdapterRegistry& registry, JobStore* store)
    : registry_(registry), store_(store) {
    LOG_DEBUG(std::string("QueueManager created (") + (store_ ? "persistent" : "in-memory") + ")");
}

std::size_t QueueManager::load() {
    if (!store_) {
        return 0;
    }

    auto records = store_->loadAll();
    std::size_t restored = 0;
    JobId maxId = 0;

    for (auto& job : records) {
        bool dirty = false;

        for (auto it = job.platforms.begin(); it != job.platforms.end();) {
            if (!registry_.contains(*it)) {
                LOG_WARN("Dropping unknown platform '" + *it + "' from " + jobLabel(job.id));
                it = job.platforms.erase(it);
                dirty = true;
            } else {
                ++it;
            }
        }

        for (auto& task : job.tasks) {
            if (!isTerminal(task.status)) {
                LOG_WARN("Recovering interrupted " + task.platform + " upload of " + jobLabel(job.id));
                task.status = TaskStatus::Failed;
                task.detail = kInterruptedDetail;
                dirty = true;
            }
        }

        if (dirty) {
            persist(job);
        }

        auto entry = std::make_shared<Entry>();
        maxId = std::max(maxId, job.id);
        JobId id = job.id;
        entry->job = std::move(job);

        std::lock_guard<std::mutex> lock(jobsMutex_);
        if (jobs_.count(id) > 0) {
            LOG_WARN("Duplicate record for " + jobLabel(id) + " ignored");
            continue;
        }
        jobs_[id] = entry;
        order_.push_back(entry);
        ++restored;
    }

    {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        nextId_ = std::max({nextId_, store_->loadNextId(), maxId + 1});
    }

    if (restored > 0) {
        LOG_INFO("Restored " + std::to_string(restored) + " job(s) from " + store_->workspace().string());
    }
    return restored;
}

AddResult QueueManager::add(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_DEBUG("Rejected missing file: " + path.string());
        return {false, 0, ErrorCode::InvalidFile, "File not found: " + path.string()};
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return {false, 0, ErrorCode::InvalidFile, "Not a regular file: " + path.string()};
    }
    if (!isSupportedVideo(path)) {
        return {false, 0, ErrorCode::InvalidFile, "Unsupported video extension: " + path.string()};
    }

    auto entry = std::make_shared<Entry>();
    Job& job = entry->job;
    job.path = std::filesystem::absolute(path, ec);
    if (ec) {
        job.path = path;
    }
    job.name = job.path.filename().string();
    job.title = job.path.stem().string();
    job.platforms = registry_.defaultPlatforms();
    job.privacy = Privacy::Public;
    job.created = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        job.id = nextId_++;
        jobs_[job.id] = entry;
        order_.push_back(entry);
        if (store_ && !store_->saveNextId(nextId_)) {
            LOG_ERROR("Failed to persist next job id");
        }
    }

    Job snapshot;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        persist(entry->job);
        snapshot = entry->job;
    }

    LOG_INFO("Queued " + jobLabel(snapshot.id) + ": " + snapshot.name);

    QueueEvent event;
    event.kind = QueueEventKind::Added;
    event.job = snapshot.id;
    event.jobStatus = JobStatus::Pending;
    notify(event);

    return {true, snapshot.id, ErrorCode::None, ""};
}

OpResult QueueManager::update(JobId id, const JobUpdate& fields) {
    auto entry = find(id);
    if (!entry) {
        return OpResult::failure(ErrorCode::NotFound, "No such job: " + std::to_string(id));
    }

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed) {
            return OpResult::failure(ErrorCode::NotFound, "No such job: " + std::to_string(id));
        }
        Job& job = entry->job;
        if (job.status() != JobStatus::Pending) {
            return OpResult::failure(ErrorCode::InvalidState,
                jobLabel(id) + " is " + toString(job.status()) + "; metadata is locked once upload starts");
        }
        if (fields.platforms) {
            if (auto valid = validatePlatforms(*fields.platforms); !valid) {
                return valid;
            }
        }

        if (fields.title) job.title = *fields.title;
        if (fields.description) job.description = *fields.description;
        if (fields.tags) job.tags = normalizeTags(*fields.tags);
        if (fields.platforms) job.platforms = *fields.platforms;
        if (fields.privacy) job.privacy = *fields.privacy;

        persist(job);
    }

    LOG_DEBUG("Updated metadata of " + jobLabel(id));

    QueueEvent event;
    event.kind = QueueEventKind::Updated;
    event.job = id;
    event.jobStatus = JobStatus::Pending;
    notify(event);
    return OpResult::success();
}

OpResult QueueManager::remove(JobId id) {
    {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return OpResult::failure(ErrorCode::NotFound, "No such job: " + std::to_string(id));
        }

        auto entry = it->second;
        std::lock_guard<std::mutex> jobLock(entry->mutex);
        if (entry->job.status() == JobStatus::Uploading) {
            return OpResult::failure(ErrorCode::InvalidState, jobLabel(id) + " is uploading");
        }

        entry->removed = true;
        jobs_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), entry), order_.end());
        if (store_ && !store_->remove(id)) {
            LOG_ERROR("Record of removed " + jobLabel(id) + " is still on disk");
        }
    }

    LOG_INFO("Removed " + jobLabel(id));

    QueueEvent event;
    event.kind = QueueEventKind::Removed;
    event.job = id;
    notify(event);
    return OpResult::success();
}

std::vector<Job> QueueManager::list() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        entries = order_;
    }

    std::vector<Job> jobs;
    jobs.reserve(entries.size());
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!entry->removed) {
            jobs.push_back(entry->job);
        }
    }
    return jobs;
}

std::optional<Job> QueueManager::get(JobId id) const {
    auto entry = find(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        return std::nullopt;
    }
    return entry->job;
}

std::vector<JobId> QueueManager::pending() const {
    std::vector<JobId> ids;
    for (const auto& job : list()) {
        if (job.status() == JobStatus::Pending) {
            ids.push_back(job.id);
        }
    }
    return ids;
}

std::size_t QueueManager::size() const {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    return order_.size();
}

OpResult QueueManager::admit(JobId id) {
    auto entry = find(id);
    if (!entry) {
        return OpResult::failure(ErrorCode::NotFound, "No such job: " + std::to_string(id));
    }

    QueueEvent event;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed) {
            return OpResult::failure(ErrorCode::NotFound, "No such job: " + std::to_string(id));
        }
        Job& job = entry->job;
        if (job.status() != JobStatus::Pending) {
            return OpResult::failure(ErrorCode::InvalidState,
                jobLabel(id) + " is " + toString(job.status()) + ", not pending");
        }
        if (job.platforms.empty()) {
            return OpResult::failure(ErrorCode::NoPlatformsSelected, jobLabel(id) + " has no platforms selected");
        }
        if (auto valid = validatePlatforms(job.platforms); !valid) {
            return valid;
        }

        for (const auto& platform : job.platforms) {
            PlatformTask task;
            task.platform = platform;
            job.tasks.push_back(std::move(task));
        }
        persist(job);

        event.kind = QueueEventKind::Admitted;
        event.job = id;
        event.jobStatus = job.status();
    }

    LOG_DEBUG("Admitted " + jobLabel(id) + " for upload");
    notify(event);
    return OpResult::success();
}

OpResult QueueManager::transition(JobId id, const PlatformId& platform, TaskStatus next, const std::string& detail) {
    auto entry = find(id);
    if (!entry) {
        return OpResult::failure(ErrorCode::NotFound, "No such job: " + std::to_string(id));
    }

    QueueEvent event;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed) {
            return OpResult::failure(ErrorCode::NotFound, "No such job: " + std::to_string(id));
        }
        Job& job = entry->job;
        PlatformTask* task = job.task(platform);
        if (!task) {
            return OpResult::failure(ErrorCode::NotFound, jobLabel(id) + " has no " + platform + " task");
        }
        if (!isAllowedTransition(task->status, next)) {
            return OpResult::failure(ErrorCode::InvalidTransition,
                std::string(toString(task->status)) + " -> " + toString(next) + " is not allowed");
        }

        task->status = next;
        switch (next) {
            case TaskStatus::Succeeded:
                task->progress = 1.0;
                task->detail.reset();
                break;
            case TaskStatus::Failed:
                task->detail = detail.empty() ? std::string(toString(ErrorCode::AdapterFailure)) : detail;
                break;
            default:
                task->detail.reset();
                break;
        }
        persist(job);
        event = taskEvent(QueueEventKind::TaskChanged, job, *task);
    }

    LOG_DEBUG(jobLabel(id) + "/" + platform + " -> " + toString(next) +
              (event.detail ? " (" + *event.detail + ")" : std::string()));
    notify(event);
    return OpResult::success();
}

OpResult QueueManager::reportProgress(JobId id, const PlatformId& platform, double fraction) {
    auto entry = find(id);
    if (!entry) {
        return OpResult::failure(ErrorCode::NotFound, "No such job: " + std::to_string(id));
    }

    QueueEvent event;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        PlatformTask* task = entry->removed ? nullptr : entry->job.task(platform);
        if (!task) {
            return OpResult::failure(ErrorCode::NotFound, jobLabel(id) + " has no " + platform + " task");
        }
        if (task->status != TaskStatus::Uploading) {
            return OpResult::failure(ErrorCode::InvalidState,
                "progress reported for " + std::string(toString(task->status)) + " task");
        }

        fraction = std::clamp(fraction, 0.0, 1.0);
        if (fraction <= task->progress) {
            return OpResult::success();
        }
        task->progress = fraction;
        event = taskEvent(QueueEventKind::Progress, entry->job, *task);
    }

    notify(event);
    return OpResult::success();
}

OpResult QueueManager::retry(JobId id, const PlatformId& platform) {
    auto entry = find(id);
    if (!entry) {
        return OpResult::failure(ErrorCode::NotFound, "No such job: " + std::to_string(id));
    }

    QueueEvent event;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        PlatformTask* task = entry->removed ? nullptr : entry->job.task(platform);
        if (!task) {
            return OpResult::failure(ErrorCode::NotFound, jobLabel(id) + " has no " + platform + " task");
        }
        if (task->status != TaskStatus::Failed) {
            return OpResult::failure(ErrorCode::InvalidTransition,
                "only failed tasks can be retried (task is " + std::string(toString(task->status)) + ")");
        }

        task->status = TaskStatus::Queued;
        task->progress = 0.0;
        task->detail.reset();
        persist(entry->job);
        event = taskEvent(QueueEventKind::TaskChanged, entry->job, *task);
    }

    LOG_INFO("Retrying " + platform + " upload of " + jobLabel(id));
    notify(event);
    return OpResult::success();
}

std::size_t QueueManager::subscribe(QueueListener listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    std::size_t token = nextToken_++;
    listeners_.emplace_back(token, std::move(listener));
    return token;
}

void QueueManager::unsubscribe(std::size_t token) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [token](const auto& entry) { return entry.first == token; }),
                     listeners_.end());
}

std::shared_ptr<QueueManager::Entry> QueueManager::find(JobId id) const {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

void QueueManager::persist(const Job& job) const noexcept {
    if (store_ && !store_->save(job)) {
        LOG_ERROR("State of " + jobLabel(job.id) + " kept in memory only");
    }
}

void QueueManager::notify(const QueueEvent& event) const {
    std::vector<QueueListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            LOG_ERROR("Queue listener threw: " + std::string(e.what()));
        }
    }
}

OpResult QueueManager::validatePlatforms(const std::set<PlatformId>& platforms) const {
    for (const auto& platform : platforms) {
        if (!registry_.contains(platform)) {
            return OpResult::failure(ErrorCode::UnsupportedPlatform, "Unknown platform: " + platform);
        }
    }
    return OpResult::success();
}

QueueEvent QueueManager::taskEvent(QueueEventKind kind, const Job& job, const PlatformTask& task) {
    QueueEvent event;
    event.kind = kind;
    event.job = job.id;
    event.jobStatus = job.status();
    event.platform = task.platform;
    event.taskStatus = task.status;
    event.progress = task.progress;
    event.detail = task.detail;
    return event;
}

}
