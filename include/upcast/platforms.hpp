/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "upcast/adapter.hpp"
#include "upcast/config.hpp"
#include "upcast/credentials.hpp"

namespace upcast {

struct TransferOptions {
    std::size_t chunkSize = 1024 * 1024;
    std::chrono::milliseconds chunkDelay{20};
};

// Shared upload path for platforms that take the file as a chunked stream.
// The remote wire protocol lives behind sendChunk().
class ChunkedAdapter : public Adapter {
public:
    ChunkedAdapter(CredentialStore& credentials, TransferOptions options);

    [[nodiscard]] AuthResult authenticate() override;
    [[nodiscard]] UploadResult upload(const Job& job, UploadContext& context) override;

protected:
    [[nodiscard]] virtual std::vector<std::string> requiredFields() const = 0;
    // Returns false with `error` set if the remote side rejected the chunk.
    [[nodiscard]] virtual bool sendChunk(const Job& job, const char* data, std::size_t size,
                                         std::size_t offset, UploadContext& context, std::string& error);

    [[nodiscard]] const TransferOptions& options() const noexcept { return options_; }

private:
    CredentialStore& credentials_;
    TransferOptions options_;
};

class YouTubeAdapter final : public ChunkedAdapter {
public:
    using ChunkedAdapter::ChunkedAdapter;

    [[nodiscard]] PlatformId id() const override { return "youtube"; }
    [[nodiscard]] std::string displayName() const override { return "YouTube"; }
    [[nodiscard]] bool defaultEnabled() const noexcept override { return true; }

protected:
    [[nodiscard]] std::vector<std::string> requiredFields() const override { return {"client_id", "client_secret"}; }
};

class InstagramAdapter final : public ChunkedAdapter {
public:
    using ChunkedAdapter::ChunkedAdapter;

    [[nodiscard]] PlatformId id() const override { return "instagram"; }
    [[nodiscard]] std::string displayName() const override { return "Instagram"; }

protected:
    [[nodiscard]] std::vector<std::string> requiredFields() const override { return {"username", "password"}; }
};

// Registered so callers get a uniform UnsupportedPlatform failure.
class TikTokAdapter final : public Adapter {
public:
    [[nodiscard]] PlatformId id() const override { return "tiktok"; }
    [[nodiscard]] std::string displayName() const override { return "TikTok"; }

    [[nodiscard]] AuthResult authenticate() override;
    [[nodiscard]] UploadResult upload(const Job& job, UploadContext& context) override;
};

[[nodiscard]] TransferOptions transferOptionsFrom(const Settings& settings) noexcept;
[[nodiscard]] AdapterRegistry makeDefaultRegistry(CredentialStore& credentials, const TransferOptions& options);

}
