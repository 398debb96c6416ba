/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/config.hpp"
#include "upcast/logger.hpp"
#include <cstdlib>
#include <limits>

namespace upcast {

namespace {
constexpr const char* kSettingsKey = "settings";

// Worker count is handed to the pool as an int
constexpr std::uint64_t kMaxConcurrency = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
constexpr std::uint64_t kMaxChunkSize = static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max());
// Keeps steady_clock::now() + value representable
constexpr std::uint64_t kMaxMilliseconds = 1000ULL * 60 * 60 * 24 * 365;

struct Limit {
    std::uint64_t max;
    bool allowZero;
};

constexpr Limit kCountLimit{kMaxConcurrency, false};
constexpr Limit kSizeLimit{kMaxChunkSize, false};
constexpr Limit kTimeoutLimit{kMaxMilliseconds, false};
constexpr Limit kDelayLimit{kMaxMilliseconds, true};

bool withinLimit(std::uint64_t value, const Limit& limit) {
    return value <= limit.max && (value != 0 || limit.allowZero);
}

std::optional<std::uint64_t> env_count(const char* name, const Limit& limit) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return std::nullopt;
    }
    auto parsed = parseCount(val);
    if (!parsed || !withinLimit(*parsed, limit)) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return std::nullopt;
    }
    return parsed;
}

std::optional<std::uint64_t> setting_count(const nlohmann::json& settings, const char* key, const Limit& limit) {
    auto it = settings.find(key);
    if (it == settings.end() || it->is_null()) {
        return std::nullopt;
    }
    auto value = nonNegative(*it);
    if (!value || !withinLimit(*value, limit)) {
        LOG_WARN(std::string("Ignoring invalid setting ") + key + "=" + it->dump());
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> setting_string(const nlohmann::json& settings, const char* key) {
    auto it = settings.find(key);
    if (it == settings.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        LOG_WARN(std::string("Ignoring non-string setting ") + key);
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::chrono::milliseconds millis(std::uint64_t value) {
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
}
}

std::optional<std::uint64_t> nonNegative(const nlohmann::json& value) noexcept {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(value.get<std::int64_t>());
    }
    return std::nullopt;
}

std::optional<std::uint64_t> parseCount(const std::string& text) noexcept {
    if (text.empty() || text.size() > 20) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

Settings settingsFrom(const nlohmann::json& config) {
    Settings settings;

    auto section = config.find(kSettingsKey);
    if (section == config.end()) {
        return settings;
    }
    if (!section->is_object()) {
        LOG_WARN("Ignoring malformed settings section");
        return settings;
    }
    const nlohmann::json& values = *section;

    if (auto workspace = setting_string(values, "workspace")) {
        settings.workspace = *workspace;
    }
    if (auto count = setting_count(values, "max_concurrency", kCountLimit)) {
        settings.maxConcurrency = static_cast<std::size_t>(*count);
    }
    if (auto timeout = setting_count(values, "upload_timeout_ms", kTimeoutLimit)) {
        settings.uploadTimeout = millis(*timeout);
    }
    if (auto interval = setting_count(values, "admission_interval_ms", kDelayLimit)) {
        settings.admissionInterval = millis(*interval);
    }
    if (auto chunk = setting_count(values, "chunk_size", kSizeLimit)) {
        settings.chunkSize = static_cast<std::size_t>(*chunk);
    }
    if (auto delay = setting_count(values, "chunk_delay_ms", kDelayLimit)) {
        settings.chunkDelay = millis(*delay);
    }
    if (auto logFile = setting_string(values, "log_file")) {
        settings.logFile = *logFile;
    }

    return settings;
}

void applyEnvironment(Settings& settings) {
    if (const char* workspace = std::getenv("UPCAST_WORKSPACE"); workspace && *workspace) {
        settings.workspace = workspace;
    }
    if (auto count = env_count("UPCAST_MAX_CONCURRENCY", kCountLimit)) {
        settings.maxConcurrency = static_cast<std::size_t>(*count);
    }
    if (auto timeout = env_count("UPCAST_UPLOAD_TIMEOUT_MS", kTimeoutLimit)) {
        settings.uploadTimeout = millis(*timeout);
    }
    if (auto interval = env_count("UPCAST_ADMISSION_INTERVAL_MS", kDelayLimit)) {
        settings.admissionInterval = millis(*interval);
    }
    if (auto chunk = env_count("UPCAST_CHUNK_SIZE", kSizeLimit)) {
        settings.chunkSize = static_cast<std::size_t>(*chunk);
    }
    if (auto delay = env_count("UPCAST_CHUNK_DELAY_MS", kDelayLimit)) {
        settings.chunkDelay = millis(*delay);
    }
}

}
