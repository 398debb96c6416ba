/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/handle.hpp"
#include "upcast/job.hpp"
#include "upcast/logger.hpp"
#include <algorithm>

namespace upcast {

void HandleState::track(JobId job, const PlatformId& platform) {
    std::lock_guard<std::mutex> lock(mutex_);
    Key key{job, platform};
    if (tasks_.count(key) > 0) {
        return;
    }

    TaskProgress entry;
    entry.job = job;
    entry.platform = platform;
    tasks_.emplace(std::move(key), std::move(entry));
    if (std::find(jobs_.begin(), jobs_.end(), job) == jobs_.end()) {
        jobs_.push_back(job);
    }
    ++remaining_;
}

void HandleState::setStatus(JobId job, const PlatformId& platform, TaskStatus status,
                            const std::optional<std::string>& detail) {
    TaskProgress update;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(Key{job, platform});
        if (it == tasks_.end()) {
            return;
        }
        TaskProgress& entry = it->second;
        if (isTerminal(entry.status)) {
            return;
        }

        entry.status = status;
        entry.detail = detail;
        if (status == TaskStatus::Succeeded) {
            entry.progress = 1.0;
        }
        update = entry;
    }

    // Listeners see the final update before waiters are released.
    publish(update);
    if (isTerminal(status)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (remaining_ > 0) {
            --remaining_;
        }
    }
    changed_.notify_all();
}

void HandleState::setProgress(JobId job, const PlatformId& platform, double fraction) {
    TaskProgress update;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(Key{job, platform});
        if (it == tasks_.end() || it->second.status != TaskStatus::Uploading) {
            return;
        }
        if (fraction <= it->second.progress) {
            return;
        }
        it->second.progress = std::min(fraction, 1.0);
        update = it->second;
    }
    publish(update);
}

void HandleState::cancel() noexcept {
    if (!cancelled_.exchange(true)) {
        LOG_DEBUG("Upload handle cancelled");
    }
    {
        // Pairs with the predicate check in sleepUntil()
        std::lock_guard<std::mutex> lock(mutex_);
    }
    changed_.notify_all();
}

bool HandleState::sleepUntil(Clock::time_point when) const {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait_until(lock, when, [this] { return cancelled_.load(); });
    return !cancelled_.load();
}

bool HandleState::done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remaining_ == 0;
}

void HandleState::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait(lock, [this] { return remaining_ == 0; });
}

bool HandleState::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return changed_.wait_for(lock, timeout, [this] { return remaining_ == 0; });
}

std::vector<TaskProgress> HandleState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskProgress> result;
    result.reserve(tasks_.size());
    for (const auto& [key, entry] : tasks_) {
        result.push_back(entry);
    }
    return result;
}

std::vector<JobId> HandleState::jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_;
}

void HandleState::subscribe(ProgressListener listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void HandleState::publish(const TaskProgress& update) const {
    std::vector<ProgressListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(update);
        } catch (const std::exception& e) {
            LOG_ERROR("Progress listener threw: " + std::string(e.what()));
        }
    }
}

UploadHandle::UploadHandle() : state_(std::make_shared<HandleState>()) {
}

UploadHandle::UploadHandle(std::shared_ptr<HandleState> state) noexcept : state_(std::move(state)) {
}

bool UploadHandle::done() const {
    return state_->done();
}

void UploadHandle::wait() const {
    state_->wait();
}

bool UploadHandle::waitFor(std::chrono::milliseconds timeout) const {
    return state_->waitFor(timeout);
}

void UploadHandle::cancel() noexcept {
    state_->cancel();
}

bool UploadHandle::cancelled() const noexcept {
    return state_->cancelled();
}

std::vector<TaskProgress> UploadHandle::snapshot() const {
    return state_->snapshot();
}

std::vector<JobId> UploadHandle::jobs() const {
    return state_->jobs();
}

void UploadHandle::subscribe(ProgressListener listener) {
    state_->subscribe(std::move(listener));
}

std::size_t UploadHandle::failedCount() const {
    auto tasks = snapshot();
    return static_cast<std::size_t>(std::count_if(tasks.begin(), tasks.end(),
        [](const TaskProgress& t) { return t.status == TaskStatus::Failed; }));
}

}
