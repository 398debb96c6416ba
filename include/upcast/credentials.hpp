/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "upcast/types.hpp"

namespace upcast {

struct Credentials {
    std::map<std::string, std::string> fields;
    bool authenticated = false;

    [[nodiscard]] bool has(const std::string& key) const;
    [[nodiscard]] std::string value(const std::string& key) const;
};

// Per-platform credentials, persisted in the "credentials" object of the
// configuration document as {"<platform>": {"<field>": "value", ...}}.
// Thread-safe.
class CredentialStore {
public:
    CredentialStore() = default;

    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    // Replaces the current contents with the credentials section of `config`.
    void loadFrom(const nlohmann::json& config);
    // Rewrites the credentials section of `config`, keeping other sections.
    void storeTo(nlohmann::json& config) const;

    [[nodiscard]] Credentials get(const PlatformId& platform) const;
    void set(const PlatformId& platform, const std::string& key, const std::string& value);
    void setAuthenticated(const PlatformId& platform, bool authenticated);
    [[nodiscard]] std::vector<PlatformId> platforms() const;

private:
    mutable std::mutex mutex_;
    std::map<PlatformId, Credentials> credentials_;
};

}
