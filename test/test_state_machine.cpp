/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "test_support.hpp"
#include "upcast/logger.hpp"
#include "upcast/queue.hpp"

using namespace upcast;
using namespace upcast::test;

namespace {

PlatformTask makeTask(const PlatformId& platform, TaskStatus status) {
    PlatformTask task;
    task.platform = platform;
    task.status = status;
    return task;
}

int test_derived_job_status() {
    std::vector<PlatformTask> tasks;
    EXPECT(deriveStatus(tasks) == JobStatus::Pending, "no tasks means pending");

    tasks = {makeTask("a", TaskStatus::Queued)};
    EXPECT(deriveStatus(tasks) == JobStatus::Uploading, "queued task means uploading");

    tasks = {makeTask("a", TaskStatus::Succeeded), makeTask("b", TaskStatus::Uploading)};
    EXPECT(deriveStatus(tasks) == JobStatus::Uploading, "non-terminal task keeps job uploading");

    tasks = {makeTask("a", TaskStatus::Failed), makeTask("b", TaskStatus::Queued)};
    EXPECT(deriveStatus(tasks) == JobStatus::Uploading, "failure does not settle job early");

    tasks = {makeTask("a", TaskStatus::Succeeded), makeTask("b", TaskStatus::Succeeded)};
    EXPECT(deriveStatus(tasks) == JobStatus::Completed, "all succeeded means completed");

    tasks = {makeTask("a", TaskStatus::Succeeded), makeTask("b", TaskStatus::Failed)};
    EXPECT(deriveStatus(tasks) == JobStatus::Failed, "any failure means failed");
    return 0;
}

int test_transition_table() {
    EXPECT(isAllowedTransition(TaskStatus::Queued, TaskStatus::Uploading), "queued -> uploading");
    EXPECT(isAllowedTransition(TaskStatus::Queued, TaskStatus::Failed), "queued -> failed");
    EXPECT(isAllowedTransition(TaskStatus::Uploading, TaskStatus::Succeeded), "uploading -> succeeded");
    EXPECT(isAllowedTransition(TaskStatus::Uploading, TaskStatus::Failed), "uploading -> failed");

    EXPECT(!isAllowedTransition(TaskStatus::Queued, TaskStatus::Succeeded), "queued cannot skip to succeeded");
    EXPECT(!isAllowedTransition(TaskStatus::Uploading, TaskStatus::Queued), "uploading cannot go back");
    EXPECT(!isAllowedTransition(TaskStatus::Succeeded, TaskStatus::Failed), "succeeded is terminal");
    EXPECT(!isAllowedTransition(TaskStatus::Failed, TaskStatus::Uploading), "failed restarts only via retry");
    return 0;
}

struct Fixture {
    TempDir dir;
    AdapterRegistry registry;
    QueueManager queue{registry};
    JobId id = 0;

    bool admitJob(const std::set<PlatformId>& platforms) {
        addFake(registry, "alpha");
        addFake(registry, "beta");
        auto added = queue.add(writeFile(dir.path() / "clip.mp4"));
        if (!added) {
            return false;
        }
        id = added.id;
        JobUpdate update;
        update.platforms = platforms;
        return static_cast<bool>(queue.update(id, update)) && static_cast<bool>(queue.admit(id));
    }
};

int test_illegal_transition_rejected() {
    Fixture f;
    EXPECT(f.admitJob({"alpha"}), "admit job");

    auto result = f.queue.transition(f.id, "alpha", TaskStatus::Succeeded);
    EXPECT(!result && result.error == ErrorCode::InvalidTransition, "queued -> succeeded rejected");

    auto job = f.queue.get(f.id);
    EXPECT(job && job->task("alpha")->status == TaskStatus::Queued, "task unchanged after rejection");

    auto missing = f.queue.transition(f.id, "beta", TaskStatus::Uploading);
    EXPECT(!missing && missing.error == ErrorCode::NotFound, "unselected platform has no task");
    return 0;
}

int test_failure_detail_recorded() {
    Fixture f;
    EXPECT(f.admitJob({"alpha", "beta"}), "admit job");

    EXPECT(f.queue.transition(f.id, "alpha", TaskStatus::Failed, "NotAuthenticated"), "fail alpha");
    EXPECT(f.queue.transition(f.id, "beta", TaskStatus::Failed), "fail beta without detail");

    auto job = f.queue.get(f.id);
    EXPECT(job->task("alpha")->detail && *job->task("alpha")->detail == "NotAuthenticated", "detail kept");
    EXPECT(job->task("beta")->detail && *job->task("beta")->detail == "AdapterFailure", "default detail");
    EXPECT(job->status() == JobStatus::Failed, "job failed");
    return 0;
}

int test_progress_is_monotonic() {
    Fixture f;
    EXPECT(f.admitJob({"alpha"}), "admit job");

    auto early = f.queue.reportProgress(f.id, "alpha", 0.3);
    EXPECT(!early && early.error == ErrorCode::InvalidState, "no progress before uploading");

    EXPECT(f.queue.transition(f.id, "alpha", TaskStatus::Uploading), "start upload");
    EXPECT(f.queue.reportProgress(f.id, "alpha", 0.4), "progress 0.4");
    EXPECT(f.queue.reportProgress(f.id, "alpha", 0.2), "stale progress accepted");
    EXPECT(f.queue.get(f.id)->task("alpha")->progress == 0.4, "stale progress ignored");

    EXPECT(f.queue.reportProgress(f.id, "alpha", 7.0), "overshoot accepted");
    EXPECT(f.queue.get(f.id)->task("alpha")->progress == 1.0, "progress clamped to 1");

    EXPECT(f.queue.transition(f.id, "alpha", TaskStatus::Succeeded), "finish upload");
    auto job = f.queue.get(f.id);
    EXPECT(job->status() == JobStatus::Completed, "job completed");
    EXPECT(!job->task("alpha")->detail, "no detail on success");
    return 0;
}

int test_retry_rules() {
    Fixture f;
    EXPECT(f.admitJob({"alpha", "beta"}), "admit job");

    auto queued = f.queue.retry(f.id, "alpha");
    EXPECT(!queued && queued.error == ErrorCode::InvalidTransition, "retry of queued task rejected");

    EXPECT(f.queue.transition(f.id, "alpha", TaskStatus::Uploading), "start alpha");
    EXPECT(f.queue.reportProgress(f.id, "alpha", 0.6), "alpha progress");
    EXPECT(f.queue.transition(f.id, "alpha", TaskStatus::Failed, "Timeout"), "fail alpha");
    EXPECT(f.queue.transition(f.id, "beta", TaskStatus::Uploading), "start beta");
    EXPECT(f.queue.transition(f.id, "beta", TaskStatus::Succeeded), "finish beta");
    EXPECT(f.queue.get(f.id)->status() == JobStatus::Failed, "job failed");

    auto succeeded = f.queue.retry(f.id, "beta");
    EXPECT(!succeeded && succeeded.error == ErrorCode::InvalidTransition, "retry of succeeded task rejected");

    EXPECT(f.queue.retry(f.id, "alpha"), "retry failed task");
    auto job = f.queue.get(f.id);
    const auto* alpha = job->task("alpha");
    EXPECT(alpha->status == TaskStatus::Queued, "retried task queued");
    EXPECT(alpha->progress == 0.0, "retry resets progress");
    EXPECT(!alpha->detail, "retry clears detail");
    EXPECT(job->status() == JobStatus::Uploading, "job uploading again");
    return 0;
}

}

int main() {
    Logger::setLevel(LogLevel::ERROR);

    if (test_derived_job_status() != 0) return 1;
    if (test_transition_table() != 0) return 1;
    if (test_illegal_transition_rejected() != 0) return 1;
    if (test_failure_detail_recorded() != 0) return 1;
    if (test_progress_is_monotonic() != 0) return 1;
    if (test_retry_rules() != 0) return 1;
    return 0;
}
