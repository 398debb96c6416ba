/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/jsonfile.hpp"
#include "upcast/logger.hpp"
#include <fstream>

namespace upcast {

std::optional<nlohmann::json> loadJson(const std::filesystem::path& path) noexcept {
    try {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            LOG_DEBUG("No file at " + path.string() + ", using empty values");
            return nlohmann::json::object();
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            LOG_ERROR("Failed to open " + path.string());
            return std::nullopt;
        }

        auto document = nlohmann::json::parse(file);
        if (!document.is_object()) {
            LOG_ERROR("Expected a JSON object in " + path.string());
            return std::nullopt;
        }
        return document;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Malformed JSON in " + path.string() + ": " + e.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool saveJson(const std::filesystem::path& path, const nlohmann::json& document) noexcept {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        auto tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                LOG_ERROR("Failed to open " + tempPath.string() + " for writing");
                return false;
            }
            file << document.dump(4) << "\n";
            file.flush();
            if (!file.good()) {
                LOG_ERROR("Failed to write " + tempPath.string());
                return false;
            }
        }

        std::filesystem::rename(tempPath, path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save " + path.string() + ": " + e.what());
        return false;
    }
}

}
