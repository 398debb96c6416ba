/*
 * upcast - Multi-platform Video Upload Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/platforms.hpp"
#include "upcast/logger.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>

namespace upcast {

ChunkedAdapter::ChunkedAdapter(CredentialStore& credentials, TransferOptions options)
    : credentials_(credentials), options_(options) {
    if (options_.chunkSize == 0) {
        options_.chunkSize = TransferOptions{}.chunkSize;
    }
}

AuthResult ChunkedAdapter::authenticate() {
    Credentials creds = credentials_.get(id());
    for (const auto& field : requiredFields()) {
        if (!creds.has(field)) {
            credentials_.setAuthenticated(id(), false);
            LOG_DEBUG(displayName() + " credentials missing field: " + field);
            return {false, ErrorCode::AuthenticationError, "missing " + id() + "." + field};
        }
    }
    credentials_.setAuthenticated(id(), true);
    return {true, ErrorCode::None, ""};
}

UploadResult ChunkedAdapter::upload(const Job& job, UploadContext& context) {
    std::error_code ec;
    auto total = std::filesystem::file_size(job.path, ec);
    if (ec) {
        return {false, ErrorCode::AdapterFailure, "cannot stat " + job.path.string() + ": " + ec.message()};
    }

    std::ifstream file(job.path, std::ios::binary);
    if (!file) {
        return {false, ErrorCode::AdapterFailure, "cannot open " + job.path.string()};
    }

    LOG_DEBUG(displayName() + " upload start: job " + std::to_string(job.id) + " (" +
              std::to_string(total) + " bytes, " + toString(job.privacy) + ")");
    context.reportProgress(0.0);

    std::vector<char> buffer(options_.chunkSize);
    std::uintmax_t sent = 0;
    while (sent < total) {
        if (context.stopRequested()) {
            return {false, context.cancelled() ? ErrorCode::Cancelled : ErrorCode::Timeout, ""};
        }

        auto want = static_cast<std::size_t>(std::min<std::uintmax_t>(buffer.size(), total - sent));
        file.read(buffer.data(), static_cast<std::streamsize>(want));
        auto got = static_cast<std::size_t>(file.gcount());
        if (got == 0) {
            return {false, ErrorCode::AdapterFailure, "short read at offset " + std::to_string(sent)};
        }

        std::string error;
        if (!sendChunk(job, buffer.data(), got, static_cast<std::size_t>(sent), context, error)) {
            if (context.stopRequested()) {
                return {false, context.cancelled() ? ErrorCode::Cancelled : ErrorCode::Timeout, ""};
            }
            return {false, ErrorCode::AdapterFailure, error};
        }

        sent += got;
        context.reportProgress(static_cast<double>(sent) / static_cast<double>(total));
    }

    context.reportProgress(1.0);
    LOG_DEBUG(displayName() + " upload done: job " + std::to_string(job.id));
    return {true, ErrorCode::None, ""};
}

bool ChunkedAdapter::sendChunk(const Job& job, const char* data, std::size_t size,
                               std::size_t offset, UploadContext& context, std::string& error) {
    (void)job;
    (void)data;
    LOG_TRACE(displayName() + " chunk @" + std::to_string(offset) + " +" + std::to_string(size));
    if (!context.pause(options_.chunkDelay)) {
        error = "interrupted";
        return false;
    }
    return true;
}

AuthResult TikTokAdapter::authenticate() {
    return {false, ErrorCode::UnsupportedPlatform, "TikTok uploads are not supported yet"};
}

UploadResult TikTokAdapter::upload(const Job& job, UploadContext& context) {
    (void)job;
    (void)context;
    return {false, ErrorCode::UnsupportedPlatform, "TikTok uploads are not supported yet"};
}

TransferOptions transferOptionsFrom(const Settings& settings) noexcept {
    TransferOptions options;
    options.chunkSize = settings.chunkSize;
    options.chunkDelay = settings.chunkDelay;
    return options;
}

AdapterRegistry makeDefaultRegistry(CredentialStore& credentials, const TransferOptions& options) {
    AdapterRegistry registry;
    registry.add(std::make_unique<YouTubeAdapter>(credentials, options));
    registry.add(std::make_unique<InstagramAdapter>(credentials, options));
    registry.add(std::make_unique<TikTokAdapter>());
    return registry;
}

}
