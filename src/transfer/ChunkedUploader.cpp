#include "transfer/ChunkedUploader.hpp"
#include "crypto/ChunkCipher.hpp"
#include "crypto/Hash.hpp"
#include "crypto/util/uuid.hpp"
#include "log/Registry.hpp"
#include "types/Error.hpp"

#include <fstream>
#include <fmt/format.h>

using namespace stratus::transfer;
using namespace stratus::types;
using namespace stratus::crypto;
using namespace stratus::util;

ChunkedUploader::ChunkedUploader(BackendPtr backend, db::MetadataStorePtr store, const config::TransferConfig& cfg,
                                 std::optional<std::vector<uint8_t>> encryptionKey)
    : backend_(std::move(backend)), store_(std::move(store)), cfg_(cfg), retry_(RetryPolicy::from(cfg)),
      key_(std::move(encryptionKey)) {
    if (!backend_) throw std::invalid_argument("ChunkedUploader requires a backend");
    if (!store_) throw std::invalid_argument("ChunkedUploader requires a metadata store");
}

template <typename Fn>
auto ChunkedUploader::withRetry(const std::string& what, const concurrency::CancellationTokenPtr& token, Fn&& fn) const {
    for (unsigned int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const BackendError& e) {
            if (!e.transient() || !retry_.shouldRetry(attempt))
                throw Error(ErrorKind::TransferFailed, fmt::format("{} failed after {} attempt(s): {}", what, attempt + 1, e.what()));

            const auto delay = retry_.delay(attempt);
            log::Registry::transfer()->warn("[ChunkedUploader] {} failed (attempt {}), retrying in {} ms: {}",
                                            what, attempt + 1, delay.count(), e.what());
            if (token && token->waitFor(delay)) throw Error(ErrorKind::Cancelled, what + " cancelled during backoff");
        }
    }
}

std::optional<std::pair<UploadSession, SessionHandle>>
ChunkedUploader::resumeSession(const UploadRequest& req, const std::string& contentHash, const uintmax_t fileSize) const {
    auto existing = store_->findSession(req.drive_id, req.local_path);
    if (!existing) return std::nullopt;

    const auto discard = [&](const std::string& why) {
        log::Registry::transfer()->info("[ChunkedUploader] Discarding upload session {} for {}: {}",
                                        existing->id, req.local_path.string(), why);
        try {
            if (const auto handle = backend_->resume(existing->token)) backend_->abort(*handle);
        } catch (const std::exception& e) {
            log::Registry::transfer()->warn("[ChunkedUploader] Unable to abort remote session {}: {}", existing->id, e.what());
        }
        store_->removeSession(existing->id);
    };

    if (existing->isExpired()) {
        discard("expired");
        return std::nullopt;
    }

    if (existing->content_hash != contentHash || existing->file_size != fileSize ||
        existing->remote_path != req.remote_path) {
        discard("source changed");
        return std::nullopt;
    }

    auto handle = backend_->resume(existing->token);
    if (!handle) {
        log::Registry::transfer()->info("[ChunkedUploader] Backend forgot session {}, starting over", existing->id);
        store_->removeSession(existing->id);
        return std::nullopt;
    }

    // The provider's acknowledgements are authoritative.
    const auto stride = handle->chunk_size ? handle->chunk_size : existing->chunk_size;
    for (auto& chunk : existing->chunks) {
        chunk.committed = false;
        chunk.ack_tag.clear();
    }
    for (const auto& [offset, tag] : handle->acknowledged) {
        const auto index = static_cast<uint32_t>(offset / stride);
        if (index < existing->chunks.size()) existing->markCommitted(index, tag);
    }

    existing->task_id = req.task_id;
    return std::make_pair(std::move(*existing), std::move(*handle));
}

UploadResult ChunkedUploader::upload(const UploadRequest& req, const concurrency::CancellationTokenPtr& token,
                                     const ProgressFn& onProgress) const {
    if (!fs::is_regular_file(req.source)) throw Error(ErrorKind::PathNotFound, "No such file: " + req.source.string());

    const auto fileSize = fs::file_size(req.source);
    const auto contentHash = Hash::blake2b(req.source);

    UploadResult result;
    result.content_hash = contentHash;
    result.bytes = fileSize;

    UploadSession session;
    SessionHandle handle;
    std::optional<ChunkCipher> cipher;

    if (auto resumed = resumeSession(req, contentHash, fileSize)) {
        session = std::move(resumed->first);
        handle = std::move(resumed->second);
        result.resumed = true;

        if (!session.cipher_suite.empty()) {
            if (!key_) throw Error(ErrorKind::TransferFailed, "Encrypted upload session but no key configured");
            cipher.emplace(*key_, cipherSuiteFromString(session.cipher_suite), b64_decode(session.cipher_nonce));
        }

        log::Registry::transfer()->info("[ChunkedUploader] Resuming {} ({} of {} chunks acknowledged)",
                                        req.local_path.string(), session.numChunks() - session.pendingChunks().size(),
                                        session.numChunks());
    } else {
        const auto plainChunk = backend_->preferredChunkSize(cfg_.chunk_size);
        session = UploadSession(fileSize, plainChunk);
        session.id = uuid4_hex();
        session.task_id = req.task_id;
        session.drive_id = req.drive_id;
        session.local_path = req.local_path;
        session.remote_path = req.remote_path;
        session.content_hash = contentHash;
        session.created_at = Clock::now();
        session.expires_at = session.created_at + cfg_.session_ttl;

        Attributes attrs{
            {attr::CONTENT_HASH, contentHash},
            {attr::PLAIN_SIZE, std::to_string(fileSize)},
            {attr::PLAIN_CHUNK_SIZE, std::to_string(plainChunk)}
        };

        uintmax_t stride = plainChunk;
        uintmax_t remoteSize = fileSize;
        if (key_) {
            cipher.emplace(ChunkCipher::create(*key_));
            session.cipher_suite = to_string(cipher->suite());
            session.cipher_nonce = b64_encode(cipher->baseNonce());
            attrs[attr::CIPHER] = session.cipher_suite;
            attrs[attr::CIPHER_NONCE] = session.cipher_nonce;
            stride = plainChunk + CHUNK_TAG_SIZE;
            remoteSize = ChunkCipher::encryptedSize(fileSize, plainChunk);
        }
        attrs[attr::CHUNK_SIZE] = std::to_string(stride);

        handle = withRetry("openSession " + req.remote_path.string(), token,
                           [&] { return backend_->openSession(req.remote_path, remoteSize, attrs); });
        session.token = handle.token;
        store_->upsertSession(session);
    }

    const uintmax_t stride = session.chunk_size + (cipher ? CHUNK_TAG_SIZE : 0);
    if (onProgress) onProgress(session.committedBytes(), fileSize);

    std::ifstream in(req.source, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open for reading: " + req.source.string());

    for (const auto index : session.pendingChunks()) {
        if (token && token->isCancelled()) {
            log::Registry::transfer()->info("[ChunkedUploader] Upload of {} cancelled at chunk {}", req.local_path.string(), index);
            throw Error(ErrorKind::Cancelled, "Upload cancelled: " + req.local_path.string());
        }

        const auto [start, end] = session.chunkRange(index);
        std::vector<uint8_t> plain(end - start);
        in.seekg(static_cast<std::streamoff>(start));
        in.read(reinterpret_cast<char*>(plain.data()), static_cast<std::streamsize>(plain.size()));
        if (static_cast<uintmax_t>(in.gcount()) != plain.size())
            throw std::runtime_error("Source changed while uploading: " + req.source.string());

        const auto payload = cipher ? cipher->encryptChunk(index, plain) : std::move(plain);
        const auto offset = static_cast<uintmax_t>(index) * stride;

        const auto tag = withRetry(fmt::format("chunk {} of {}", index, req.local_path.string()), token,
                                   [&] { return backend_->writeChunk(handle, offset, payload); });

        session.markCommitted(index, tag);
        store_->upsertSession(session);
        ++result.chunks_sent;

        if (onProgress) onProgress(session.committedBytes(), fileSize);
    }

    result.object = withRetry("finalize " + req.remote_path.string(), token, [&] { return backend_->finalize(handle); });
    store_->removeSession(session.id);

    log::Registry::transfer()->debug("[ChunkedUploader] Uploaded {} -> {} ({} bytes, {} chunks sent)",
                                     req.local_path.string(), result.object.path.string(), fileSize, result.chunks_sent);
    return result;
}
