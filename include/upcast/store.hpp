/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "upcast/job.hpp"

namespace upcast {

// Durable job records under <workspace>/jobs, one "<id>.json" file each.
// Writes go through a temp file and an atomic rename.
class JobStore final {
public:
    explicit JobStore(const std::filesystem::path& workspace, bool createIfMissing = true);

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    [[nodiscard]] bool save(const Job& job) const noexcept;
    [[nodiscard]] bool remove(JobId id) const noexcept;
    // Records sorted by id; unreadable records are logged and skipped.
    [[nodiscard]] std::vector<Job> loadAll() const noexcept;

    [[nodiscard]] bool saveNextId(JobId next) const noexcept;
    [[nodiscard]] JobId loadNextId() const noexcept;

    [[nodiscard]] bool isReady() const noexcept { return ready_; }
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }

    [[nodiscard]] static nlohmann::json toRecord(const Job& job);
    // std::nullopt when required fields are missing or of the wrong type.
    [[nodiscard]] static std::optional<Job> fromRecord(const nlohmann::json& record);

private:
    std::filesystem::path workspace_;
    std::filesystem::path jobsPath_;
    bool ready_ = false;

    [[nodiscard]] bool createWorkspace(bool createIfMissing) noexcept;
    [[nodiscard]] std::filesystem::path recordPath(JobId id) const;
};

}
