/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace upcast {

// Missing file is not an error: returns an empty object.
// Unreadable or malformed file yields std::nullopt.
[[nodiscard]] std::optional<nlohmann::json> loadJson(const std::filesystem::path& path) noexcept;

// Writes <path>.tmp then renames over <path>.
[[nodiscard]] bool saveJson(const std::filesystem::path& path, const nlohmann::json& document) noexcept;

}
