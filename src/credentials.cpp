/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/credentials.hpp"
#include "upcast/job.hpp"
#include "upcast/logger.hpp"

namespace upcast {

namespace {
constexpr const char* kCredentialsKey = "credentials";
constexpr const char* kAuthenticatedField = "authenticated";
}

bool Credentials::has(const std::string& key) const {
    auto it = fields.find(key);
    return it != fields.end() && !trim(it->second).empty();
}

std::string Credentials::value(const std::string& key) const {
    auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
}

void CredentialStore::loadFrom(const nlohmann::json& config) {
    std::map<PlatformId, Credentials> loaded;

    auto section = config.find(kCredentialsKey);
    if (section != config.end() && section->is_object()) {
        for (const auto& [platform, entry] : section->items()) {
            if (!entry.is_object()) {
                LOG_WARN("Ignoring malformed credentials for " + platform);
                continue;
            }
            auto& creds = loaded[platform];
            for (const auto& [field, value] : entry.items()) {
                if (field == kAuthenticatedField) {
                    creds.authenticated = value.is_boolean() && value.get<bool>();
                } else if (value.is_string()) {
                    creds.fields[field] = value.get<std::string>();
                } else {
                    LOG_WARN("Ignoring non-string credential " + platform + "." + field);
                }
            }
        }
    } else if (section != config.end()) {
        LOG_WARN("Ignoring malformed credentials section");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    credentials_ = std::move(loaded);
    LOG_DEBUG("Loaded credentials for " + std::to_string(credentials_.size()) + " platform(s)");
}

void CredentialStore::storeTo(nlohmann::json& config) const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json section = nlohmann::json::object();
    for (const auto& [platform, creds] : credentials_) {
        nlohmann::json entry = nlohmann::json::object();
        for (const auto& [field, value] : creds.fields) {
            entry[field] = value;
        }
        entry[kAuthenticatedField] = creds.authenticated;
        section[platform] = std::move(entry);
    }
    config[kCredentialsKey] = std::move(section);
}

Credentials CredentialStore::get(const PlatformId& platform) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = credentials_.find(platform);
    return it == credentials_.end() ? Credentials{} : it->second;
}

void CredentialStore::set(const PlatformId& platform, const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& creds = credentials_[platform];
    creds.fields[key] = value;
    // New material has not been verified against the service yet
    creds.authenticated = false;
}

void CredentialStore::setAuthenticated(const PlatformId& platform, bool authenticated) {
    std::lock_guard<std::mutex> lock(mutex_);
    credentials_[platform].authenticated = authenticated;
}

std::vector<PlatformId> CredentialStore::platforms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PlatformId> ids;
    ids.reserve(credentials_.size());
    for (const auto& entry : credentials_) {
        ids.push_back(entry.first);
    }
    return ids;
}

}
