/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/adapter.hpp"
#include "upcast/logger.hpp"
#include <algorithm>
#include <thread>

namespace upcast {

UploadContext::UploadContext(CancelCheck cancelled, Clock::time_point deadline, ProgressSink progress)
    : cancelled_(std::move(cancelled)), deadline_(deadline), progress_(std::move(progress)) {
}

bool UploadContext::cancelled() const {
    return cancelled_ && cancelled_();
}

bool UploadContext::timedOut() const noexcept {
    return Clock::now() >= deadline_;
}

void UploadContext::reportProgress(double fraction) {
    fraction = std::clamp(fraction, 0.0, 1.0);
    if (fraction < lastProgress_) {
        return;
    }
    lastProgress_ = fraction;
    if (progress_) {
        progress_(fraction);
    }
}

bool UploadContext::pause(std::chrono::milliseconds duration) const {
    const auto step = std::chrono::milliseconds(10);
    const auto end = Clock::now() + duration;
    while (Clock::now() < end) {
        if (stopRequested()) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(end - Clock::now());
        std::this_thread::sleep_for(std::min(step, std::max(remaining, std::chrono::milliseconds(1))));
    }
    return !stopRequested();
}

bool AdapterRegistry::add(std::unique_ptr<Adapter> adapter) {
    if (!adapter) {
        LOG_ERROR("Refusing to register null adapter");
        return false;
    }
    if (contains(adapter->id())) {
        LOG_WARN("Adapter already registered: " + adapter->id());
        return false;
    }
    LOG_DEBUG("Registered adapter: " + adapter->id());
    adapters_.push_back(std::move(adapter));
    return true;
}

Adapter* AdapterRegistry::find(const PlatformId& id) const {
    for (const auto& adapter : adapters_) {
        if (adapter->id() == id) {
            return adapter.get();
        }
    }
    return nullptr;
}

std::set<PlatformId> AdapterRegistry::defaultPlatforms() const {
    std::set<PlatformId> result;
    for (const auto& adapter : adapters_) {
        if (adapter->defaultEnabled()) {
            result.insert(adapter->id());
        }
    }
    return result;
}

}
