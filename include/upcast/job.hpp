/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "upcast/types.hpp"

namespace upcast {

struct PlatformTask {
    PlatformId platform;
    TaskStatus status = TaskStatus::Queued;
    double progress = 0.0;
    // Set only while status == Failed
    std::optional<std::string> detail;
};

struct Job {
    JobId id = 0;
    std::filesystem::path path;
    std::string name;
    std::string title;
    std::string description;
    std::set<std::string> tags;
    std::set<PlatformId> platforms;
    Privacy privacy = Privacy::Public;
    std::chrono::system_clock::time_point created;
    // Empty until the job is admitted for upload
    std::vector<PlatformTask> tasks;

    [[nodiscard]] JobStatus status() const noexcept;
    [[nodiscard]] const PlatformTask* task(const PlatformId& platform) const noexcept;
    [[nodiscard]] PlatformTask* task(const PlatformId& platform) noexcept;
};

// Fields left empty are not touched by QueueManager::update.
struct JobUpdate {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::set<PlatformId>> platforms;
    std::optional<Privacy> privacy;
};

[[nodiscard]] JobStatus deriveStatus(const std::vector<PlatformTask>& tasks) noexcept;

// Legal PlatformTask edges; retry (Failed -> Queued) is handled separately.
[[nodiscard]] bool isAllowedTransition(TaskStatus from, TaskStatus to) noexcept;
[[nodiscard]] bool isTerminal(TaskStatus status) noexcept;

[[nodiscard]] std::string trim(const std::string& value);

// Trims, drops empties, removes duplicates.
[[nodiscard]] std::set<std::string> normalizeTags(const std::vector<std::string>& tags);
// Splits "a, b ,c" on commas, then normalizes.
[[nodiscard]] std::set<std::string> parseTagList(const std::string& text);
[[nodiscard]] std::string joinList(const std::set<std::string>& items, const char* separator = ",");

[[nodiscard]] bool isSupportedVideo(const std::filesystem::path& path);
[[nodiscard]] const std::vector<std::string>& supportedVideoExtensions();

}
