/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/types.hpp"

namespace upcast {

const char* toString(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Queued: return "queued";
        case TaskStatus::Uploading: return "uploading";
        case TaskStatus::Succeeded: return "succeeded";
        case TaskStatus::Failed: return "failed";
        default: return "unknown";
    }
}

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Uploading: return "uploading";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        default: return "unknown";
    }
}

const char* toString(Privacy privacy) noexcept {
    return privacy == Privacy::Private ? "private" : "public";
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidFile: return "InvalidFile";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::InvalidTransition: return "InvalidTransition";
        case ErrorCode::NoPlatformsSelected: return "NoPlatformsSelected";
        case ErrorCode::NotAuthenticated: return "NotAuthenticated";
        case ErrorCode::AuthenticationError: return "AuthenticationError";
        case ErrorCode::UnsupportedPlatform: return "UnsupportedPlatform";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::AdapterFailure: return "AdapterFailure";
        case ErrorCode::IoError: return "IoError";
        default: return "Unknown";
    }
}

std::optional<TaskStatus> parseTaskStatus(const std::string& text) noexcept {
    if (text == "queued") return TaskStatus::Queued;
    if (text == "uploading") return TaskStatus::Uploading;
    if (text == "succeeded") return TaskStatus::Succeeded;
    if (text == "failed") return TaskStatus::Failed;
    return std::nullopt;
}

std::optional<Privacy> parsePrivacy(const std::string& text) noexcept {
    if (text == "public") return Privacy::Public;
    if (text == "private") return Privacy::Private;
    return std::nullopt;
}

} // namespace upcast
