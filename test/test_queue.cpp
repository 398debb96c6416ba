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

int test_add_validates_file() {
    TempDir dir;
    AdapterRegistry registry;
    addFake(registry, "youtube", FakeAdapter::Mode::Succeed, true);
    addFake(registry, "instagram", FakeAdapter::Mode::Succeed, false);
    QueueManager queue(registry);

    auto missing = queue.add(dir.path() / "nope.mp4");
    EXPECT(!missing && missing.error == ErrorCode::InvalidFile, "missing file rejected");

    auto text = queue.add(writeFile(dir.path() / "notes.txt"));
    EXPECT(!text && text.error == ErrorCode::InvalidFile, "non-video extension rejected");

    auto folder = dir.path() / "folder.mp4";
    std::filesystem::create_directories(folder);
    auto directory = queue.add(folder);
    EXPECT(!directory && directory.error == ErrorCode::InvalidFile, "directory rejected");
    EXPECT(queue.size() == 0, "nothing queued after rejections");

    auto added = queue.add(writeFile(dir.path() / "Holiday Trip.MOV"));
    EXPECT(added, "upper-case extension accepted");

    auto job = queue.get(added.id);
    EXPECT(job, "job retrievable");
    EXPECT(job->name == "Holiday Trip.MOV", "name is file name");
    EXPECT(job->title == "Holiday Trip", "title defaults to stem");
    EXPECT(job->status() == JobStatus::Pending, "new job pending");
    EXPECT(job->tasks.empty(), "no tasks before admission");
    EXPECT(job->privacy == Privacy::Public, "public by default");
    EXPECT(job->platforms == std::set<PlatformId>{"youtube"}, "default-enabled platforms selected");
    return 0;
}

int test_ids_and_listing_order() {
    TempDir dir;
    AdapterRegistry registry;
    addFake(registry, "youtube");
    QueueManager queue(registry);

    auto first = queue.add(writeFile(dir.path() / "b.mp4"));
    auto second = queue.add(writeFile(dir.path() / "a.mkv"));
    auto third = queue.add(writeFile(dir.path() / "c.avi"));
    EXPECT(first && second && third, "three files added");
    EXPECT(first.id < second.id && second.id < third.id, "ids increase");

    auto jobs = queue.list();
    EXPECT(jobs.size() == 3, "three jobs listed");
    EXPECT(jobs[0].id == first.id && jobs[1].id == second.id && jobs[2].id == third.id, "insertion order");

    EXPECT(queue.remove(second.id), "remove middle job");
    auto fourth = queue.add(writeFile(dir.path() / "d.wmv"));
    EXPECT(fourth.id > third.id, "ids never reused");

    auto pending = queue.pending();
    EXPECT(pending.size() == 3 && pending[0] == first.id && pending[2] == fourth.id, "pending in queue order");
    EXPECT(!queue.get(second.id), "removed job gone");
    return 0;
}

int test_update_metadata() {
    TempDir dir;
    AdapterRegistry registry;
    addFake(registry, "youtube");
    addFake(registry, "instagram", FakeAdapter::Mode::Succeed, false);
    QueueManager queue(registry);
    auto added = queue.add(writeFile(dir.path() / "clip.mp4"));
    EXPECT(added, "add");

    JobUpdate update;
    update.title = "Launch video";
    update.description = "Line one\nLine two";
    update.tags = std::vector<std::string>{" launch ", "", "product", "launch"};
    update.platforms = std::set<PlatformId>{"youtube", "instagram"};
    update.privacy = Privacy::Private;
    EXPECT(queue.update(added.id, update), "update pending job");

    auto job = queue.get(added.id);
    EXPECT(job->title == "Launch video", "title updated");
    EXPECT(job->description == "Line one\nLine two", "description updated");
    EXPECT(job->tags == std::set<std::string>({"launch", "product"}), "tags trimmed and deduplicated");
    EXPECT(job->platforms.size() == 2, "platforms updated");
    EXPECT(job->privacy == Privacy::Private, "privacy updated");

    JobUpdate titleOnly;
    titleOnly.title = "Final cut";
    EXPECT(queue.update(added.id, titleOnly), "partial update");
    job = queue.get(added.id);
    EXPECT(job->title == "Final cut" && job->privacy == Privacy::Private, "unset fields untouched");

    JobUpdate unknown;
    unknown.platforms = std::set<PlatformId>{"vimeo"};
    auto rejected = queue.update(added.id, unknown);
    EXPECT(!rejected && rejected.error == ErrorCode::UnsupportedPlatform, "unknown platform rejected");

    auto missing = queue.update(999, titleOnly);
    EXPECT(!missing && missing.error == ErrorCode::NotFound, "unknown job");
    return 0;
}

int test_update_locked_after_admission() {
    TempDir dir;
    AdapterRegistry registry;
    addFake(registry, "youtube");
    QueueManager queue(registry);
    auto added = queue.add(writeFile(dir.path() / "clip.mp4"));
    EXPECT(queue.admit(added.id), "admit");

    JobUpdate update;
    update.title = "Changed";
    update.privacy = Privacy::Private;
    auto result = queue.update(added.id, update);
    EXPECT(!result && result.error == ErrorCode::InvalidState, "update on uploading job rejected");

    auto job = queue.get(added.id);
    EXPECT(job->title == "clip" && job->privacy == Privacy::Public, "metadata unchanged");

    auto again = queue.admit(added.id);
    EXPECT(!again && again.error == ErrorCode::InvalidState, "second admission rejected");
    return 0;
}

int test_admission_requires_platforms() {
    TempDir dir;
    AdapterRegistry registry;
    addFake(registry, "youtube", FakeAdapter::Mode::Succeed, false);
    QueueManager queue(registry);
    auto added = queue.add(writeFile(dir.path() / "clip.mp4"));
    EXPECT(added, "add");

    auto result = queue.admit(added.id);
    EXPECT(!result && result.error == ErrorCode::NoPlatformsSelected, "no platforms selected");
    EXPECT(queue.get(added.id)->status() == JobStatus::Pending, "job still pending");

    auto missing = queue.admit(42);
    EXPECT(!missing && missing.error == ErrorCode::NotFound, "unknown job");
    return 0;
}

int test_remove_rules() {
    TempDir dir;
    AdapterRegistry registry;
    addFake(registry, "youtube");
    QueueManager queue(registry);
    auto added = queue.add(writeFile(dir.path() / "clip.mp4"));
    EXPECT(queue.admit(added.id), "admit");

    auto busy = queue.remove(added.id);
    EXPECT(!busy && busy.error == ErrorCode::InvalidState, "remove of uploading job rejected");

    EXPECT(queue.transition(added.id, "youtube", TaskStatus::Uploading), "start");
    EXPECT(queue.transition(added.id, "youtube", TaskStatus::Succeeded), "finish");
    EXPECT(queue.remove(added.id), "remove completed job");

    auto gone = queue.remove(added.id);
    EXPECT(!gone && gone.error == ErrorCode::NotFound, "second remove not found");
    return 0;
}

int test_observers() {
    TempDir dir;
    AdapterRegistry registry;
    addFake(registry, "youtube");
    QueueManager queue(registry);

    std::vector<QueueEvent> events;
    auto token = queue.subscribe([&](const QueueEvent& event) { events.push_back(event); });

    auto added = queue.add(writeFile(dir.path() / "clip.mp4"));
    JobUpdate update;
    update.title = "Renamed";
    EXPECT(queue.update(added.id, update), "update");
    EXPECT(queue.admit(added.id), "admit");
    EXPECT(queue.transition(added.id, "youtube", TaskStatus::Uploading), "start");
    EXPECT(queue.reportProgress(added.id, "youtube", 0.5), "progress");

    EXPECT(events.size() == 5, "one event per change");
    EXPECT(events[0].kind == QueueEventKind::Added && events[0].job == added.id, "added event");
    EXPECT(events[1].kind == QueueEventKind::Updated, "updated event");
    EXPECT(events[2].kind == QueueEventKind::Admitted && events[2].jobStatus == JobStatus::Uploading, "admitted event");
    EXPECT(events[3].kind == QueueEventKind::TaskChanged && events[3].taskStatus == TaskStatus::Uploading,
           "task changed event");
    EXPECT(events[4].kind == QueueEventKind::Progress && events[4].progress == 0.5, "progress event");

    queue.unsubscribe(token);
    EXPECT(queue.transition(added.id, "youtube", TaskStatus::Succeeded), "finish");
    EXPECT(events.size() == 5, "no events after unsubscribe");
    return 0;
}

int test_listener_can_read_queue() {
    TempDir dir;
    AdapterRegistry registry;
    addFake(registry, "youtube");
    QueueManager queue(registry);

    JobStatus seen = JobStatus::Pending;
    queue.subscribe([&](const QueueEvent& event) {
        if (auto job = queue.get(event.job)) {
            seen = job->status();
        }
    });

    auto added = queue.add(writeFile(dir.path() / "clip.mp4"));
    EXPECT(queue.admit(added.id), "admit from listener-observed queue");
    EXPECT(seen == JobStatus::Uploading, "listener saw admitted state without deadlock");
    return 0;
}

}

int main() {
    Logger::setLevel(LogLevel::ERROR);

    if (test_add_validates_file() != 0) return 1;
    if (test_ids_and_listing_order() != 0) return 1;
    if (test_update_metadata() != 0) return 1;
    if (test_update_locked_after_admission() != 0) return 1;
    if (test_admission_requires_platforms() != 0) return 1;
    if (test_remove_rules() != 0) return 1;
    if (test_observers() != 0) return 1;
    if (test_listener_can_read_queue() != 0) return 1;
    return 0;
}
