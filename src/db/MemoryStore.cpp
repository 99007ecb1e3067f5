#include "db/MemoryStore.hpp"

#include <algorithm>
#include <ranges>
#include <mutex>

using namespace stratus::db;
using namespace stratus::types;
using namespace stratus::util;

FileRecord MemoryStore::upsert(const FileRecord& record) {
    std::unique_lock lock(mutex_);
    const Key key{record.drive_id, record.local_path.generic_string()};

    FileRecord stored = record;
    const auto now = Clock::now();

    if (const auto it = records_.find(key); it != records_.end()) {
        stored.created_at = it->second.created_at;
        stored.updated_at = std::max(now, it->second.updated_at + std::chrono::microseconds(1));
    } else {
        stored.created_at = now;
        stored.updated_at = now;
    }

    records_[key] = stored;
    return stored;
}

std::optional<FileRecord> MemoryStore::get(const DriveId& driveId, const std::filesystem::path& localPath) {
    std::shared_lock lock(mutex_);
    if (const auto it = records_.find({driveId, localPath.generic_string()}); it != records_.end()) return it->second;
    return std::nullopt;
}

std::vector<FileRecord> MemoryStore::listByDrive(const DriveId& driveId) {
    std::shared_lock lock(mutex_);
    std::vector<FileRecord> out;
    for (auto it = records_.lower_bound({driveId, ""}); it != records_.end() && it->first.first == driveId; ++it)
        out.push_back(it->second);
    return out;
}

std::vector<FileRecord> MemoryStore::listUpdatedBetween(const Timestamp from, const Timestamp to) {
    std::shared_lock lock(mutex_);
    std::vector<FileRecord> out;
    for (const auto& rec : records_ | std::views::values)
        if (rec.updated_at >= from && rec.updated_at < to) out.push_back(rec);
    std::ranges::sort(out, {}, &FileRecord::updated_at);
    return out;
}

bool MemoryStore::remove(const DriveId& driveId, const std::filesystem::path& localPath) {
    std::unique_lock lock(mutex_);
    return records_.erase({driveId, localPath.generic_string()}) > 0;
}

size_t MemoryStore::removeByDrive(const DriveId& driveId) {
    std::unique_lock lock(mutex_);
    const auto removed = std::erase_if(records_, [&](const auto& kv) { return kv.first.first == driveId; });
    std::erase_if(sessions_, [&](const auto& kv) { return kv.second.drive_id == driveId; });
    return removed;
}

void MemoryStore::upsertSession(const UploadSession& session) {
    std::unique_lock lock(mutex_);
    auto stored = session;
    stored.updated_at = Clock::now();
    sessions_[session.id] = std::move(stored);
}

std::optional<UploadSession> MemoryStore::findSession(const DriveId& driveId, const std::filesystem::path& localPath) {
    std::shared_lock lock(mutex_);
    for (const auto& s : sessions_ | std::views::values)
        if (s.drive_id == driveId && s.local_path == localPath) return s;
    return std::nullopt;
}

void MemoryStore::removeSession(const std::string& sessionId) {
    std::unique_lock lock(mutex_);
    sessions_.erase(sessionId);
}

size_t MemoryStore::purgeExpiredSessions(const Timestamp now) {
    std::unique_lock lock(mutex_);
    return std::erase_if(sessions_, [&](const auto& kv) { return kv.second.isExpired(now); });
}
