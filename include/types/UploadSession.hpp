#pragma once

#include "types/Drive.hpp"
#include "util/timestamp.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace stratus::types {

struct ChunkProgress {
    uint32_t index = 0;
    bool committed = false;
    std::string ack_tag;    // part ETag or equivalent acknowledgement
};

// Durable state of one chunked upload, persisted after every acknowledged chunk.
struct UploadSession {
    std::string id;
    std::string task_id;
    DriveId drive_id;
    std::filesystem::path local_path;
    std::filesystem::path remote_path;
    std::string token;                  // backend session token
    uintmax_t file_size = 0;
    uintmax_t chunk_size = 0;
    std::vector<ChunkProgress> chunks;
    std::string content_hash;           // BLAKE2b of the plaintext source
    std::string cipher_suite;           // empty when unencrypted
    std::string cipher_nonce;           // base64 base nonce
    util::Timestamp expires_at{};
    util::Timestamp created_at{};
    util::Timestamp updated_at{};

    UploadSession() = default;
    UploadSession(uintmax_t fileSize, uintmax_t chunkSize);

    [[nodiscard]] uint32_t numChunks() const;
    [[nodiscard]] std::vector<uint32_t> pendingChunks() const;
    [[nodiscard]] std::pair<uintmax_t, uintmax_t> chunkRange(uint32_t index) const;   // [start, end)
    [[nodiscard]] uintmax_t chunkSizeFor(uint32_t index) const;
    [[nodiscard]] uintmax_t committedBytes() const;
    [[nodiscard]] double progress() const;
    [[nodiscard]] bool isComplete() const { return pendingChunks().empty(); }
    [[nodiscard]] bool isExpired(util::Timestamp now = util::Clock::now()) const { return expires_at <= now; }

    void markCommitted(uint32_t index, const std::string& ackTag);
};

void to_json(nlohmann::json& j, const ChunkProgress& c);
void from_json(const nlohmann::json& j, ChunkProgress& c);
void to_json(nlohmann::json& j, const UploadSession& s);
void from_json(const nlohmann::json& j, UploadSession& s);

}
