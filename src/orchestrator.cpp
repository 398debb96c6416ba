/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/orchestrator.hpp"
#include "upcast/logger.hpp"
#include "upcast/pool.hpp"
#include <algorithm>
#include <limits>

namespace upcast {

namespace {
std::string describe(const UploadTask& task) {
    return "job " + std::to_string(task.job) + "/" + task.platform;
}
}

std::string failureDetail(ErrorCode error, const std::string& message) {
    switch (error) {
        case ErrorCode::Cancelled:
        case ErrorCode::Timeout:
        case ErrorCode::UnsupportedPlatform:
        case ErrorCode::NotAuthenticated:
            return toString(error);
        default:
            break;
    }
    if (error == ErrorCode::None) {
        error = ErrorCode::AdapterFailure;
    }
    std::string detail = toString(error);
    if (!message.empty()) {
        detail += ": " + message;
    }
    return detail;
}

Orchestrator::Orchestrator(QueueManager& queue, const AdapterRegistry& registry, const Settings& settings)
    : queue_(queue), registry_(registry), settings_(settings) {
    if (settings_.maxConcurrency == 0) {
        settings_.maxConcurrency = Settings{}.maxConcurrency;
    }
    LOG_DEBUG("Orchestrator created - workers: " + std::to_string(settings_.maxConcurrency) +
              ", timeout: " + std::to_string(settings_.uploadTimeout.count()) + "ms" +
              ", admission interval: " + std::to_string(settings_.admissionInterval.count()) + "ms");
}

Orchestrator::~Orchestrator() {
    shutdown();
}

bool Orchestrator::start() {
    if (running_.load()) {
        LOG_WARN("Orchestrator already running");
        return false;
    }

    try {
        const auto workers = std::min<std::size_t>(settings_.maxConcurrency,
                                                  static_cast<std::size_t>(std::numeric_limits<int>::max()));
        pool_ = std::make_unique<Pool>(static_cast<int>(workers));
        if (!pool_->start([this](const UploadTask& task, int workerId) { process(task, workerId); })) {
            LOG_ERROR("Failed to start upload workers");
            pool_.reset();
            return false;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start orchestrator: " + std::string(e.what()));
        pool_.reset();
        return false;
    }

    running_.store(true);
    LOG_DEBUG("Orchestrator started");
    return true;
}

void Orchestrator::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down uploads...");

    try {
        {
            std::lock_guard<std::mutex> lock(handlesMutex_);
            for (auto& weak : handles_) {
                if (auto handle = weak.lock()) {
                    handle->cancel();
                }
            }
            handles_.clear();
        }

        if (!pool_) {
            return;
        }
        pool_->stop();
        auto leftovers = pool_->drain();
        for (const auto& task : leftovers) {
            settle(task, TaskStatus::Failed, toString(ErrorCode::Cancelled));
        }
        if (!leftovers.empty()) {
            LOG_INFO("Cancelled " + std::to_string(leftovers.size()) + " unstarted upload(s)");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error during shutdown: " + std::string(e.what()));
    }

    LOG_INFO("Upload shutdown complete");
}

DispatchResult Orchestrator::uploadOne(JobId id) {
    if (!running_.load()) {
        return notRunning();
    }

    if (auto admitted = queue_.admit(id); !admitted) {
        LOG_DEBUG("Upload of job " + std::to_string(id) + " refused: " + admitted.message);
        return {false, UploadHandle(), admitted.error, admitted.message};
    }

    auto handle = newHandle();
    dispatch(id, handle, Clock::now());
    return {true, UploadHandle(handle), ErrorCode::None, ""};
}

DispatchResult Orchestrator::uploadAll() {
    if (!running_.load()) {
        return notRunning();
    }

    auto handle = newHandle();
    std::vector<JobId> admitted;
    for (JobId id : queue_.pending()) {
        if (auto result = queue_.admit(id); !result) {
            LOG_WARN("Skipping job " + std::to_string(id) + ": " + result.message);
            continue;
        }
        admitted.push_back(id);
    }

    if (admitted.empty()) {
        LOG_INFO("No pending jobs to upload");
        return {true, UploadHandle(handle), ErrorCode::None, ""};
    }

    // Track everything first so the handle cannot report done mid-batch.
    for (JobId id : admitted) {
        if (auto job = queue_.get(id)) {
            for (const auto& task : job->tasks) {
                handle->track(id, task.platform);
            }
        }
    }

    const auto start = Clock::now();
    for (std::size_t i = 0; i < admitted.size(); ++i) {
        dispatch(admitted[i], handle, start + settings_.admissionInterval * static_cast<long>(i));
    }

    LOG_INFO("Dispatched " + std::to_string(admitted.size()) + " job(s) for upload");
    return {true, UploadHandle(handle), ErrorCode::None, ""};
}

DispatchResult Orchestrator::retry(JobId id, const PlatformId& platform) {
    if (!running_.load()) {
        return notRunning();
    }

    if (auto result = queue_.retry(id, platform); !result) {
        return {false, UploadHandle(), result.error, result.message};
    }

    auto handle = newHandle();
    handle->track(id, platform);
    UploadTask task;
    task.job = id;
    task.platform = platform;
    task.handle = handle;
    task.notBefore = Clock::now();
    if (!pool_->submit(task)) {
        settle(task, TaskStatus::Failed, toString(ErrorCode::Cancelled));
    }
    return {true, UploadHandle(handle), ErrorCode::None, ""};
}

DispatchResult Orchestrator::notRunning() const {
    return {false, UploadHandle(), ErrorCode::InvalidState, "uploads are not running"};
}

std::shared_ptr<HandleState> Orchestrator::newHandle() {
    auto handle = std::make_shared<HandleState>();
    std::lock_guard<std::mutex> lock(handlesMutex_);
    handles_.erase(std::remove_if(handles_.begin(), handles_.end(),
                                  [](const std::weak_ptr<HandleState>& weak) { return weak.expired(); }),
                   handles_.end());
    handles_.push_back(handle);
    return handle;
}

void Orchestrator::dispatch(JobId id, const std::shared_ptr<HandleState>& handle, Clock::time_point notBefore) {
    auto job = queue_.get(id);
    if (!job) {
        LOG_ERROR("Admitted job " + std::to_string(id) + " disappeared before dispatch");
        return;
    }

    std::vector<UploadTask> tasks;
    for (const auto& platformTask : job->tasks) {
        if (platformTask.status != TaskStatus::Queued) {
            continue;
        }
        UploadTask task;
        task.job = id;
        task.platform = platformTask.platform;
        task.handle = handle;
        task.notBefore = notBefore;
        handle->track(id, task.platform);
        tasks.push_back(std::move(task));
    }

    for (auto& task : tasks) {
        if (!pool_->submit(task)) {
            settle(task, TaskStatus::Failed, toString(ErrorCode::Cancelled));
        }
    }
}

void Orchestrator::process(const UploadTask& task, int workerId) {
    const auto& handle = task.handle;
    const std::string label = describe(task);

    if (Clock::now() < task.notBefore && !handle->sleepUntil(task.notBefore)) {
        settle(task, TaskStatus::Failed, toString(ErrorCode::Cancelled));
        return;
    }
    if (handle->cancelled()) {
        settle(task, TaskStatus::Failed, toString(ErrorCode::Cancelled));
        return;
    }

    Adapter* adapter = registry_.find(task.platform);
    if (!adapter) {
        LOG_ERROR("No adapter for " + label);
        settle(task, TaskStatus::Failed, toString(ErrorCode::UnsupportedPlatform));
        return;
    }

    auto job = queue_.get(task.job);
    if (!job) {
        LOG_ERROR("Job vanished before upload: " + label);
        handle->setStatus(task.job, task.platform, TaskStatus::Failed, std::string(toString(ErrorCode::NotFound)));
        return;
    }

    AuthResult auth;
    try {
        auth = adapter->authenticate();
    } catch (const std::exception& e) {
        auth = {false, ErrorCode::AuthenticationError, e.what()};
    }
    if (!auth) {
        LOG_WARN(adapter->displayName() + " authentication failed for " + label +
                 (auth.message.empty() ? std::string() : ": " + auth.message));
        settle(task, TaskStatus::Failed,
               auth.error == ErrorCode::UnsupportedPlatform ? toString(ErrorCode::UnsupportedPlatform)
                                                            : toString(ErrorCode::NotAuthenticated));
        return;
    }

    if (auto started = queue_.transition(task.job, task.platform, TaskStatus::Uploading); !started) {
        LOG_ERROR("Cannot start " + label + ": " + started.message);
        handle->setStatus(task.job, task.platform, TaskStatus::Failed, started.message);
        return;
    }
    handle->setStatus(task.job, task.platform, TaskStatus::Uploading);

    LOG_INFO("Worker-" + std::to_string(workerId) + " uploading " + job->name + " to " + adapter->displayName());
    const auto begin = Clock::now();

    UploadContext context(
        [handle] { return handle->cancelled(); },
        begin + settings_.uploadTimeout,
        [this, &task, &handle](double fraction) {
            if (queue_.reportProgress(task.job, task.platform, fraction)) {
                handle->setProgress(task.job, task.platform, fraction);
            }
        });

    UploadResult result;
    try {
        result = adapter->upload(*job, context);
    } catch (const std::exception& e) {
        result = {false, ErrorCode::AdapterFailure, e.what()};
    } catch (...) {
        LOG_ERROR("Unknown exception from " + adapter->displayName() + " adapter");
        result = {false, ErrorCode::AdapterFailure, "unknown error"};
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - begin);

    if (result && !context.timedOut()) {
        settle(task, TaskStatus::Succeeded, "");
        LOG_INFO(label + " succeeded in " + std::to_string(elapsed.count()) + "ms");
        return;
    }

    ErrorCode error = result.error;
    if (context.timedOut()) {
        error = ErrorCode::Timeout;
    } else if (context.cancelled()) {
        error = ErrorCode::Cancelled;
    }

    std::string detail = failureDetail(error, result.message);
    settle(task, TaskStatus::Failed, detail);
    LOG_WARN(label + " failed after " + std::to_string(elapsed.count()) + "ms: " + detail);
}

void Orchestrator::settle(const UploadTask& task, TaskStatus status, const std::string& detail) {
    if (auto result = queue_.transition(task.job, task.platform, status, detail); !result) {
        LOG_WARN("Could not settle " + describe(task) + ": " + result.message);
    }

    std::optional<std::string> reported;
    if (status == TaskStatus::Failed) {
        reported = detail;
    }
    if (task.handle) {
        task.handle->setStatus(task.job, task.platform, status, reported);
    }
}

}
