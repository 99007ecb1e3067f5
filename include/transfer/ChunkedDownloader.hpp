#pragma once

#include "concurrency/CancellationToken.hpp"
#include "config/Config.hpp"
#include "transfer/Backend.hpp"
#include "transfer/ChunkedUploader.hpp"
#include "transfer/RetryPolicy.hpp"

#include <optional>

namespace stratus::transfer {

struct DownloadRequest {
    fs::path remote_path;
    fs::path staging_path;
};

struct DownloadResult {
    RemoteObject object;
    fs::path staging_path;
    uintmax_t bytes = 0;
    std::string content_hash;
};

// Reads an object chunk by chunk into a staging file. The staging file is verified against the
// recorded size and content hash before it is returned; on any failure it is removed.
class ChunkedDownloader {
public:
    ChunkedDownloader(BackendPtr backend, const config::TransferConfig& cfg,
                      std::optional<std::vector<uint8_t>> encryptionKey = std::nullopt);

    DownloadResult download(const DownloadRequest& req, const concurrency::CancellationTokenPtr& token,
                            const ProgressFn& onProgress = {}) const;

private:
    BackendPtr backend_;
    config::TransferConfig cfg_;
    RetryPolicy retry_;
    std::optional<std::vector<uint8_t>> key_;

    DownloadResult fetch(const DownloadRequest& req, const concurrency::CancellationTokenPtr& token,
                         const ProgressFn& onProgress) const;

    template <typename Fn>
    auto withRetry(const std::string& what, const concurrency::CancellationTokenPtr& token, Fn&& fn) const;
};

}
