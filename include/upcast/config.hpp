/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace upcast {

constexpr const char* kDefaultConfigFile = "upcast.json";
constexpr const char* kDefaultWorkspace = ".upcast";

struct Settings {
    std::filesystem::path workspace = kDefaultWorkspace;
    std::size_t maxConcurrency = 4;
    std::chrono::milliseconds uploadTimeout{30 * 60 * 1000};
    // Pause between starting successive jobs of an upload-all batch
    std::chrono::milliseconds admissionInterval{0};
    std::size_t chunkSize = 1024 * 1024;
    std::chrono::milliseconds chunkDelay{20};
    std::filesystem::path logFile;
};

// Plain decimal digits only: no sign, no trailing text, no overflow.
[[nodiscard]] std::optional<std::uint64_t> parseCount(const std::string& text) noexcept;

// Integer JSON values >= 0; floats, negatives and other types give nullopt.
[[nodiscard]] std::optional<std::uint64_t> nonNegative(const nlohmann::json& value) noexcept;

// Reads the "settings" object of the configuration document. Values that
// are negative, fractional, out of range, of the wrong type, or zero where
// zero is meaningless keep their defaults.
[[nodiscard]] Settings settingsFrom(const nlohmann::json& config);

// UPCAST_* environment variables override whatever is already set, under
// the same validation rules.
void applyEnvironment(Settings& settings);

}
