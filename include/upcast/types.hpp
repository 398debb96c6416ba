/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace upcast {

// Monotonically increasing, never reused.
using JobId = std::uint64_t;

// Lowercase adapter name ("youtube", "instagram", ...).
using PlatformId = std::string;

enum class TaskStatus : std::uint8_t { Queued, Uploading, Succeeded, Failed };

// Derived from the job's tasks, never stored.
enum class JobStatus : std::uint8_t { Pending, Uploading, Completed, Failed };

enum class Privacy : std::uint8_t { Public, Private };

enum class ErrorCode : std::uint8_t {
    None = 0,
    InvalidFile,
    NotFound,
    InvalidState,
    InvalidTransition,
    NoPlatformsSelected,
    NotAuthenticated,
    AuthenticationError,
    UnsupportedPlatform,
    Timeout,
    Cancelled,
    AdapterFailure,
    IoError
};

struct OpResult {
    bool ok = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }

    static OpResult success() { return {true, ErrorCode::None, ""}; }
    static OpResult failure(ErrorCode code, std::string msg) { return {false, code, std::move(msg)}; }
};

struct AddResult {
    bool ok = false;
    JobId id = 0;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] const char* toString(TaskStatus status) noexcept;
[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] const char* toString(Privacy privacy) noexcept;
[[nodiscard]] const char* toString(ErrorCode code) noexcept;

[[nodiscard]] std::optional<TaskStatus> parseTaskStatus(const std::string& text) noexcept;
[[nodiscard]] std::optional<Privacy> parsePrivacy(const std::string& text) noexcept;

} // namespace upcast
