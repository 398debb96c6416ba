/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/job.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace upcast {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

std::string trim(const std::string& value) {
    const char* ws = " \t\r\n";
    auto start = value.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(ws);
    return value.substr(start, end - start + 1);
}

JobStatus Job::status() const noexcept {
    return deriveStatus(tasks);
}

const PlatformTask* Job::task(const PlatformId& platform) const noexcept {
    for (const auto& t : tasks) {
        if (t.platform == platform) {
            return &t;
        }
    }
    return nullptr;
}

PlatformTask* Job::task(const PlatformId& platform) noexcept {
    for (auto& t : tasks) {
        if (t.platform == platform) {
            return &t;
        }
    }
    return nullptr;
}

JobStatus deriveStatus(const std::vector<PlatformTask>& tasks) noexcept {
    if (tasks.empty()) {
        return JobStatus::Pending;
    }

    bool anyFailed = false;
    for (const auto& t : tasks) {
        if (!isTerminal(t.status)) {
            return JobStatus::Uploading;
        }
        anyFailed = anyFailed || t.status == TaskStatus::Failed;
    }

    return anyFailed ? JobStatus::Failed : JobStatus::Completed;
}

bool isAllowedTransition(TaskStatus from, TaskStatus to) noexcept {
    switch (from) {
        case TaskStatus::Queued:
            return to == TaskStatus::Uploading || to == TaskStatus::Failed;
        case TaskStatus::Uploading:
            return to == TaskStatus::Succeeded || to == TaskStatus::Failed;
        default:
            return false;
    }
}

bool isTerminal(TaskStatus status) noexcept {
    return status == TaskStatus::Succeeded || status == TaskStatus::Failed;
}

std::set<std::string> normalizeTags(const std::vector<std::string>& tags) {
    std::set<std::string> result;
    for (const auto& tag : tags) {
        std::string cleaned = trim(tag);
        if (!cleaned.empty()) {
            result.insert(cleaned);
        }
    }
    return result;
}

std::set<std::string> parseTagList(const std::string& text) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ',')) {
        parts.push_back(part);
    }
    return normalizeTags(parts);
}

std::string joinList(const std::set<std::string>& items, const char* separator) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += separator;
        }
        out += item;
    }
    return out;
}

const std::vector<std::string>& supportedVideoExtensions() {
    static const std::vector<std::string> extensions = {".mp4", ".avi", ".mov", ".mkv", ".wmv", ".flv"};
    return extensions;
}

bool isSupportedVideo(const std::filesystem::path& path) {
    std::string ext = toLowerCopy(path.extension().string());
    const auto& valid = supportedVideoExtensions();
    return std::find(valid.begin(), valid.end(), ext) != valid.end();
}

}
