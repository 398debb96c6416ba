/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "upcast/adapter.hpp"
#include "upcast/handle.hpp"
#include "upcast/job.hpp"

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while (0)

namespace upcast::test {

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("upcast-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::filesystem::path writeFile(const std::filesystem::path& path, std::size_t bytes = 16) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    for (std::size_t i = 0; i < bytes; ++i) {
        out.put(static_cast<char>('a' + i % 26));
    }
    return path;
}

// Concurrency and timing observations shared by fake adapters.
struct FlightRecorder {
    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};
    std::atomic<int> uploads{0};
    std::mutex mutex;
    std::map<JobId, std::chrono::steady_clock::time_point> started;

    void enter(JobId job) {
        int now = ++inFlight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        ++uploads;
        std::lock_guard<std::mutex> lock(mutex);
        started.emplace(job, std::chrono::steady_clock::now());
    }
    void leave() { --inFlight; }
};

class FakeAdapter final : public Adapter {
public:
    enum class Mode { Succeed, Fail, Throw, WaitForStop, IgnoreStop };

    FakeAdapter(PlatformId id, Mode mode = Mode::Succeed, bool enabled = true,
                std::shared_ptr<FlightRecorder> recorder = nullptr,
                std::chrono::milliseconds hold = std::chrono::milliseconds(0))
        : id_(std::move(id)), mode_(mode), enabled_(enabled),
          recorder_(recorder ? std::move(recorder) : std::make_shared<FlightRecorder>()), hold_(hold) {}

    PlatformId id() const override { return id_; }
    std::string displayName() const override { return "Fake " + id_; }
    bool defaultEnabled() const noexcept override { return enabled_; }

    AuthResult authenticate() override {
        if (!authOk.load()) {
            return {false, ErrorCode::AuthenticationError, "rejected"};
        }
        return {true, ErrorCode::None, ""};
    }

    UploadResult upload(const Job& job, UploadContext& context) override {
        recorder_->enter(job.id);
        struct Leave {
            FlightRecorder& recorder;
            ~Leave() { recorder.leave(); }
        } leave{*recorder_};

        context.reportProgress(0.0);
        switch (mode_.load()) {
            case Mode::Succeed:
                if (hold_.count() > 0 && !context.pause(hold_)) {
                    return {false, context.cancelled() ? ErrorCode::Cancelled : ErrorCode::Timeout, ""};
                }
                context.reportProgress(0.5);
                context.reportProgress(1.0);
                return {true, ErrorCode::None, ""};
            case Mode::Fail:
                return {false, ErrorCode::AdapterFailure, "remote rejected upload"};
            case Mode::Throw:
                throw std::runtime_error("connection reset");
            case Mode::WaitForStop:
                uploading.store(true);
                while (!context.stopRequested()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                return {false, context.cancelled() ? ErrorCode::Cancelled : ErrorCode::Timeout, ""};
            case Mode::IgnoreStop:
                std::this_thread::sleep_for(hold_);
                return {true, ErrorCode::None, ""};
        }
        return {false, ErrorCode::AdapterFailure, "unreachable"};
    }

    void setMode(Mode mode) { mode_.store(mode); }
    FlightRecorder& recorder() { return *recorder_; }

    std::atomic<bool> authOk{true};
    std::atomic<bool> uploading{false};

private:
    PlatformId id_;
    std::atomic<Mode> mode_;
    bool enabled_;
    std::shared_ptr<FlightRecorder> recorder_;
    std::chrono::milliseconds hold_;
};

template <typename... Args>
FakeAdapter* addFake(AdapterRegistry& registry, Args&&... args) {
    auto adapter = std::make_unique<FakeAdapter>(std::forward<Args>(args)...);
    FakeAdapter* raw = adapter.get();
    return registry.add(std::move(adapter)) ? raw : nullptr;
}

inline const TaskProgress* findTask(const std::vector<TaskProgress>& tasks, JobId job, const PlatformId& platform) {
    auto it = std::find_if(tasks.begin(), tasks.end(), [&](const TaskProgress& t) {
        return t.job == job && t.platform == platform;
    });
    return it == tasks.end() ? nullptr : &*it;
}

// Polls until `pred` holds or `limit` elapses.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) {
    auto end = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < end) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

}
