/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "upcast/job.hpp"
#include "upcast/types.hpp"

namespace upcast {

struct AuthResult {
    bool ok = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct UploadResult {
    bool ok = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Handed to Adapter::upload for the duration of one attempt. Adapters poll
// stopRequested() between I/O chunks and return promptly once it is set.
class UploadContext final {
public:
    using Clock = std::chrono::steady_clock;
    using CancelCheck = std::function<bool()>;
    using ProgressSink = std::function<void(double)>;

    UploadContext(CancelCheck cancelled, Clock::time_point deadline, ProgressSink progress);

    UploadContext(const UploadContext&) = delete;
    UploadContext& operator=(const UploadContext&) = delete;

    [[nodiscard]] bool cancelled() const;
    [[nodiscard]] bool timedOut() const noexcept;
    [[nodiscard]] bool stopRequested() const { return cancelled() || timedOut(); }

    // Fraction in [0,1]; values below the last report are dropped.
    void reportProgress(double fraction);

    // Sleeps up to `duration`; returns false early if a stop was requested.
    bool pause(std::chrono::milliseconds duration) const;

private:
    CancelCheck cancelled_;
    Clock::time_point deadline_;
    ProgressSink progress_;
    double lastProgress_ = 0.0;
};

class Adapter {
public:
    virtual ~Adapter() = default;

    [[nodiscard]] virtual PlatformId id() const = 0;
    [[nodiscard]] virtual std::string displayName() const = 0;
    [[nodiscard]] virtual bool defaultEnabled() const noexcept { return false; }

    // Must not perform the upload itself. Called from worker threads.
    [[nodiscard]] virtual AuthResult authenticate() = 0;
    [[nodiscard]] virtual UploadResult upload(const Job& job, UploadContext& context) = 0;
};

class AdapterRegistry final {
public:
    AdapterRegistry() = default;

    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;
    AdapterRegistry(AdapterRegistry&&) noexcept = default;
    AdapterRegistry& operator=(AdapterRegistry&&) noexcept = default;

    // Rejects null adapters and duplicate ids.
    bool add(std::unique_ptr<Adapter> adapter);

    [[nodiscard]] Adapter* find(const PlatformId& id) const;
    [[nodiscard]] bool contains(const PlatformId& id) const { return find(id) != nullptr; }
    [[nodiscard]] std::set<PlatformId> defaultPlatforms() const;
    [[nodiscard]] std::size_t size() const noexcept { return adapters_.size(); }

private:
    std::vector<std::unique_ptr<Adapter>> adapters_;
};

}
