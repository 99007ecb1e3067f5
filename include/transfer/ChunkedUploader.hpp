#pragma once

#include "concurrency/CancellationToken.hpp"
#include "config/Config.hpp"
#include "db/MetadataStore.hpp"
#include "transfer/Backend.hpp"
#include "transfer/RetryPolicy.hpp"

#include <functional>
#include <optional>

namespace stratus::crypto { class ChunkCipher; }

namespace stratus::transfer {

struct UploadRequest {
    types::DriveId drive_id;
    std::string task_id;
    fs::path source;         // absolute local file
    fs::path local_path;     // drive-relative, keys the persisted session
    fs::path remote_path;
};

struct UploadResult {
    RemoteObject object;
    std::string content_hash;
    uintmax_t bytes = 0;
    bool resumed = false;
    uint32_t chunks_sent = 0;
};

// committed bytes, total bytes
using ProgressFn = std::function<void(uintmax_t, uintmax_t)>;

class ChunkedUploader {
public:
    ChunkedUploader(BackendPtr backend, db::MetadataStorePtr store, const config::TransferConfig& cfg,
                    std::optional<std::vector<uint8_t>> encryptionKey = std::nullopt);

    // Throws Error(Cancelled) when the token fires between chunks; the persisted session then
    // stays resumable until it expires. Throws Error(TransferFailed) once retries are exhausted.
    UploadResult upload(const UploadRequest& req, const concurrency::CancellationTokenPtr& token,
                        const ProgressFn& onProgress = {}) const;

private:
    BackendPtr backend_;
    db::MetadataStorePtr store_;
    config::TransferConfig cfg_;
    RetryPolicy retry_;
    std::optional<std::vector<uint8_t>> key_;

    // Returns a live session matching the source, discarding stale or expired ones.
    std::optional<std::pair<types::UploadSession, SessionHandle>> resumeSession(const UploadRequest& req,
                                                                                const std::string& contentHash,
                                                                                uintmax_t fileSize) const;

    template <typename Fn>
    auto withRetry(const std::string& what, const concurrency::CancellationTokenPtr& token, Fn&& fn) const;
};

}
