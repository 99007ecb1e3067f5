#include "types/UploadSession.hpp"

#include <algorithm>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace stratus::types;
using namespace stratus::util;

UploadSession::UploadSession(const uintmax_t fileSize, const uintmax_t chunkSize)
    : file_size(fileSize), chunk_size(chunkSize) {
    if (chunk_size == 0) throw std::invalid_argument("chunk_size must be greater than zero");
    const auto n = numChunks();
    chunks.reserve(n);
    for (uint32_t i = 0; i < n; ++i) chunks.push_back({i, false, {}});
}

uint32_t UploadSession::numChunks() const {
    if (chunk_size == 0) return 0;
    return static_cast<uint32_t>(std::max<uintmax_t>(1, (file_size + chunk_size - 1) / chunk_size));
}

std::vector<uint32_t> UploadSession::pendingChunks() const {
    std::vector<uint32_t> out;
    for (const auto& c : chunks)
        if (!c.committed) out.push_back(c.index);
    return out;
}

std::pair<uintmax_t, uintmax_t> UploadSession::chunkRange(const uint32_t index) const {
    const uintmax_t start = static_cast<uintmax_t>(index) * chunk_size;
    const uintmax_t end = std::min(start + chunk_size, file_size);
    return {start, std::max(start, end)};
}

uintmax_t UploadSession::chunkSizeFor(const uint32_t index) const {
    const auto [start, end] = chunkRange(index);
    return end - start;
}

uintmax_t UploadSession::committedBytes() const {
    uintmax_t total = 0;
    for (const auto& c : chunks)
        if (c.committed) total += chunkSizeFor(c.index);
    return total;
}

double UploadSession::progress() const {
    if (file_size == 0) return isComplete() ? 1.0 : 0.0;
    return static_cast<double>(committedBytes()) / static_cast<double>(file_size);
}

void UploadSession::markCommitted(const uint32_t index, const std::string& ackTag) {
    if (index >= chunks.size()) throw std::out_of_range("chunk index out of range");
    chunks[index].committed = true;
    chunks[index].ack_tag = ackTag;
}

void stratus::types::to_json(nlohmann::json& j, const ChunkProgress& c) {
    j = {{"index", c.index}, {"committed", c.committed}, {"ack_tag", c.ack_tag}};
}

void stratus::types::from_json(const nlohmann::json& j, ChunkProgress& c) {
    c.index = j.at("index").get<uint32_t>();
    c.committed = j.value("committed", false);
    c.ack_tag = j.value("ack_tag", "");
}

void stratus::types::to_json(nlohmann::json& j, const UploadSession& s) {
    j = {
        {"id", s.id},
        {"task_id", s.task_id},
        {"drive_id", s.drive_id},
        {"local_path", s.local_path.string()},
        {"remote_path", s.remote_path.string()},
        {"token", s.token},
        {"file_size", s.file_size},
        {"chunk_size", s.chunk_size},
        {"chunks", s.chunks},
        {"content_hash", s.content_hash},
        {"cipher_suite", s.cipher_suite},
        {"cipher_nonce", s.cipher_nonce},
        {"expires_at", toMicros(s.expires_at)},
        {"created_at", toMicros(s.created_at)},
        {"updated_at", toMicros(s.updated_at)}
    };
}

void stratus::types::from_json(const nlohmann::json& j, UploadSession& s) {
    s.id = j.at("id").get<std::string>();
    s.task_id = j.value("task_id", "");
    s.drive_id = j.at("drive_id").get<std::string>();
    s.local_path = j.at("local_path").get<std::string>();
    s.remote_path = j.at("remote_path").get<std::string>();
    s.token = j.at("token").get<std::string>();
    s.file_size = j.at("file_size").get<uintmax_t>();
    s.chunk_size = j.at("chunk_size").get<uintmax_t>();
    s.chunks = j.value("chunks", std::vector<ChunkProgress>{});
    s.content_hash = j.value("content_hash", "");
    s.cipher_suite = j.value("cipher_suite", "");
    s.cipher_nonce = j.value("cipher_nonce", "");
    s.expires_at = fromMicros(j.value("expires_at", static_cast<int64_t>(0)));
    s.created_at = fromMicros(j.value("created_at", static_cast<int64_t>(0)));
    s.updated_at = fromMicros(j.value("updated_at", static_cast<int64_t>(0)));
}
