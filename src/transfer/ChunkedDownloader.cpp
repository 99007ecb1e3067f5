#include "transfer/ChunkedDownloader.hpp"
#include "crypto/ChunkCipher.hpp"
#include "crypto/Hash.hpp"
#include "log/Registry.hpp"
#include "types/Error.hpp"

#include <fstream>
#include <fmt/format.h>

using namespace stratus::transfer;
using namespace stratus::types;
using namespace stratus::crypto;

namespace {

uintmax_t attrOr(const Attributes& attrs, const char* key, const uintmax_t fallback) {
    const auto it = attrs.find(key);
    return it == attrs.end() ? fallback : std::stoull(it->second);
}

}

ChunkedDownloader::ChunkedDownloader(BackendPtr backend, const config::TransferConfig& cfg,
                                     std::optional<std::vector<uint8_t>> encryptionKey)
    : backend_(std::move(backend)), cfg_(cfg), retry_(RetryPolicy::from(cfg)), key_(std::move(encryptionKey)) {
    if (!backend_) throw std::invalid_argument("ChunkedDownloader requires a backend");
}

template <typename Fn>
auto ChunkedDownloader::withRetry(const std::string& what, const concurrency::CancellationTokenPtr& token, Fn&& fn) const {
    for (unsigned int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const BackendError& e) {
            if (!e.transient() || !retry_.shouldRetry(attempt))
                throw Error(ErrorKind::TransferFailed, fmt::format("{} failed after {} attempt(s): {}", what, attempt + 1, e.what()));

            const auto delay = retry_.delay(attempt);
            log::Registry::transfer()->warn("[ChunkedDownloader] {} failed (attempt {}), retrying in {} ms: {}",
                                            what, attempt + 1, delay.count(), e.what());
            if (token && token->waitFor(delay)) throw Error(ErrorKind::Cancelled, what + " cancelled during backoff");
        }
    }
}

DownloadResult ChunkedDownloader::download(const DownloadRequest& req, const concurrency::CancellationTokenPtr& token,
                                           const ProgressFn& onProgress) const {
    try {
        return fetch(req, token, onProgress);
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(req.staging_path, ec);
        throw;
    }
}

DownloadResult ChunkedDownloader::fetch(const DownloadRequest& req, const concurrency::CancellationTokenPtr& token,
                                        const ProgressFn& onProgress) const {
    const auto obj = withRetry("stat " + req.remote_path.string(), token, [&] { return backend_->stat(req.remote_path); });
    if (!obj) throw Error(ErrorKind::PathNotFound, "Remote object not found: " + req.remote_path.string());

    std::optional<ChunkCipher> cipher;
    if (const auto it = obj->attributes.find(attr::CIPHER); it != obj->attributes.end()) {
        if (!key_) throw Error(ErrorKind::TransferFailed, "Object is encrypted but the drive has no key: " + req.remote_path.string());
        const auto nonce = obj->attributes.find(attr::CIPHER_NONCE);
        if (nonce == obj->attributes.end()) throw Error(ErrorKind::TransferFailed, "Encrypted object has no nonce");
        cipher.emplace(*key_, cipherSuiteFromString(it->second), b64_decode(nonce->second));
    }

    const auto plainSize = attrOr(obj->attributes, attr::PLAIN_SIZE, cipher ? 0 : obj->size);
    const auto plainChunk = attrOr(obj->attributes, attr::PLAIN_CHUNK_SIZE, cfg_.chunk_size);
    const auto stride = cipher ? plainChunk + CHUNK_TAG_SIZE : plainChunk;
    if (stride == 0) throw Error(ErrorKind::TransferFailed, "Object records a zero chunk size");

    fs::create_directories(req.staging_path.parent_path());
    std::ofstream out(req.staging_path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open staging file: " + req.staging_path.string());

    StreamingHash hasher;
    uintmax_t written = 0;
    uint64_t index = 0;

    if (onProgress) onProgress(0, plainSize);

    for (uintmax_t offset = 0; offset < obj->size; offset += stride, ++index) {
        if (token && token->isCancelled())
            throw Error(ErrorKind::Cancelled, "Download cancelled: " + req.remote_path.string());

        const auto len = std::min(stride, obj->size - offset);
        auto bytes = withRetry(fmt::format("chunk {} of {}", index, req.remote_path.string()), token,
                               [&] { return backend_->readChunk(req.remote_path, offset, len); });

        if (bytes.size() != len)
            throw Error(ErrorKind::TransferFailed, fmt::format("Short read at offset {} of {}", offset, req.remote_path.string()));

        if (cipher) {
            try {
                bytes = cipher->decryptChunk(index, bytes);
            } catch (const std::exception& e) {
                throw Error(ErrorKind::TransferFailed, fmt::format("Chunk {} of {} failed authentication: {}",
                                                                   index, req.remote_path.string(), e.what()));
            }
        }

        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out) throw std::runtime_error("Failed to write staging file: " + req.staging_path.string());

        hasher.update(bytes);
        written += bytes.size();
        if (onProgress) onProgress(written, plainSize);
    }

    out.close();

    if (written != plainSize)
        throw Error(ErrorKind::TransferFailed, fmt::format("Size mismatch for {}: expected {}, got {}",
                                                           req.remote_path.string(), plainSize, written));

    DownloadResult result{*obj, req.staging_path, written, hasher.finalHex()};

    if (const auto it = obj->attributes.find(attr::CONTENT_HASH); it != obj->attributes.end() && it->second != result.content_hash) {
        log::Registry::transfer()->warn("[ChunkedDownloader] Checksum mismatch for {}", req.remote_path.string());
        throw Error(ErrorKind::TransferFailed, "Checksum mismatch for " + req.remote_path.string());
    }

    return result;
}
