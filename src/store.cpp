/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/store.hpp"
#include "upcast/config.hpp"
#include "upcast/jsonfile.hpp"
#include "upcast/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

namespace upcast {

namespace {
constexpr const char* kRecordExtension = ".json";
constexpr const char* kNextIdFile = "next_id";

std::optional<std::set<std::string>> stringSet(const nlohmann::json& record, const char* key) {
    std::set<std::string> items;
    auto it = record.find(key);
    if (it == record.end()) {
        return items;
    }
    if (!it->is_array()) {
        return std::nullopt;
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return std::nullopt;
        }
        items.insert(item.get<std::string>());
    }
    return items;
}

std::string stringOr(const nlohmann::json& record, const char* key, const std::string& fallback) {
    auto it = record.find(key);
    return (it != record.end() && it->is_string()) ? it->get<std::string>() : fallback;
}
}

JobStore::JobStore(const std::filesystem::path& workspace, bool createIfMissing)
    : workspace_(workspace), jobsPath_(workspace / "jobs") {
    ready_ = createWorkspace(createIfMissing);
    if (!ready_) {
        LOG_ERROR("Failed to initialize workspace: " + workspace_.string());
    }
}

bool JobStore::createWorkspace(bool createIfMissing) noexcept {
    try {
        if (!std::filesystem::exists(workspace_) && !createIfMissing) {
            return false;
        }
        std::filesystem::create_directories(jobsPath_);
        LOG_DEBUG("Workspace ready: " + workspace_.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

std::filesystem::path JobStore::recordPath(JobId id) const {
    return jobsPath_ / (std::to_string(id) + kRecordExtension);
}

bool JobStore::save(const Job& job) const noexcept {
    try {
        if (!saveJson(recordPath(job.id), toRecord(job))) {
            LOG_ERROR("Failed to persist job " + std::to_string(job.id));
            return false;
        }
        LOG_TRACE("Persisted job " + std::to_string(job.id));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist job " + std::to_string(job.id) + ": " + e.what());
        return false;
    }
}

bool JobStore::remove(JobId id) const noexcept {
    std::error_code ec;
    std::filesystem::remove(recordPath(id), ec);
    if (ec) {
        LOG_ERROR("Failed to delete record for job " + std::to_string(id) + ": " + ec.message());
        return false;
    }
    return true;
}

std::vector<Job> JobStore::loadAll() const noexcept {
    std::vector<Job> jobs;
    try {
        if (!std::filesystem::exists(jobsPath_)) {
            return jobs;
        }

        for (const auto& entry : std::filesystem::directory_iterator(jobsPath_)) {
            if (!entry.is_regular_file() || entry.path().extension() != kRecordExtension) {
                continue;
            }
            auto record = loadJson(entry.path());
            if (!record) {
                LOG_WARN("Skipping unreadable job record: " + entry.path().string());
                continue;
            }
            auto job = fromRecord(*record);
            if (!job) {
                LOG_WARN("Skipping unreadable job record: " + entry.path().string());
                continue;
            }
            jobs.push_back(std::move(*job));
        }

        std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) { return a.id < b.id; });
        if (!jobs.empty()) {
            LOG_DEBUG("Loaded " + std::to_string(jobs.size()) + " job record(s)");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading job records: " + std::string(e.what()));
    }
    return jobs;
}

bool JobStore::saveNextId(JobId next) const noexcept {
    try {
        auto path = jobsPath_ / kNextIdFile;
        auto tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::trunc);
            if (!file) {
                LOG_ERROR("Failed to open " + tempPath.string() + " for writing");
                return false;
            }
            file << next << "\n";
            file.flush();
            if (!file.good()) {
                LOG_ERROR("Failed to write " + tempPath.string());
                return false;
            }
        }
        std::filesystem::rename(tempPath, path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist next job id: " + std::string(e.what()));
        return false;
    }
}

JobId JobStore::loadNextId() const noexcept {
    try {
        std::ifstream file(jobsPath_ / kNextIdFile);
        if (!file) {
            return 1;
        }
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        auto next = parseCount(trim(content));
        if (!next || *next == 0) {
            LOG_WARN("Ignoring invalid next job id file");
            return 1;
        }
        return static_cast<JobId>(*next);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read next job id: " + std::string(e.what()));
        return 1;
    }
}

nlohmann::json JobStore::toRecord(const Job& job) {
    nlohmann::json tasks = nlohmann::json::array();
    for (const auto& task : job.tasks) {
        nlohmann::json entry = {
            {"platform", task.platform},
            {"status", toString(task.status)},
            {"progress", task.progress}
        };
        if (task.detail) {
            entry["detail"] = *task.detail;
        }
        tasks.push_back(std::move(entry));
    }

    return nlohmann::json{
        {"id", job.id},
        {"path", job.path.string()},
        {"name", job.name},
        {"title", job.title},
        {"description", job.description},
        {"tags", job.tags},
        {"platforms", job.platforms},
        {"privacy", toString(job.privacy)},
        {"created", std::chrono::duration_cast<std::chrono::seconds>(job.created.time_since_epoch()).count()},
        {"tasks", std::move(tasks)}
    };
}

std::optional<Job> JobStore::fromRecord(const nlohmann::json& record) {
    if (!record.is_object()) {
        return std::nullopt;
    }
    auto id = record.find("id");
    auto path = record.find("path");
    if (id == record.end() || path == record.end() || !path->is_string() || path->get<std::string>().empty()) {
        return std::nullopt;
    }
    auto number = nonNegative(*id);
    if (!number || *number == 0) {
        return std::nullopt;
    }

    Job job;
    job.id = static_cast<JobId>(*number);
    job.path = path->get<std::string>();
    job.name = stringOr(record, "name", job.path.filename().string());
    job.title = stringOr(record, "title", job.path.stem().string());
    job.description = stringOr(record, "description", "");

    auto tags = stringSet(record, "tags");
    auto platforms = stringSet(record, "platforms");
    if (!tags || !platforms) {
        return std::nullopt;
    }
    job.tags = std::move(*tags);
    job.platforms = std::move(*platforms);
    job.privacy = parsePrivacy(stringOr(record, "privacy", "public")).value_or(Privacy::Public);
    if (auto created = record.find("created"); created != record.end() && created->is_number_integer()) {
        job.created = std::chrono::system_clock::time_point(std::chrono::seconds(created->get<std::int64_t>()));
    }

    auto tasks = record.find("tasks");
    if (tasks == record.end()) {
        return job;
    }
    if (!tasks->is_array()) {
        return std::nullopt;
    }
    for (const auto& entry : *tasks) {
        if (!entry.is_object()) {
            return std::nullopt;
        }
        auto platform = stringOr(entry, "platform", "");
        auto status = parseTaskStatus(stringOr(entry, "status", ""));
        if (platform.empty() || !status || job.task(platform)) {
            return std::nullopt;
        }

        PlatformTask task;
        task.platform = platform;
        task.status = *status;
        if (auto progress = entry.find("progress"); progress != entry.end() && progress->is_number()) {
            task.progress = std::clamp(progress->get<double>(), 0.0, 1.0);
        }
        if (task.status == TaskStatus::Failed) {
            task.detail = stringOr(entry, "detail", toString(ErrorCode::AdapterFailure));
        }
        job.tasks.push_back(std::move(task));
    }

    return job;
}

}
