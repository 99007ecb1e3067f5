#pragma once

#include "db/MetadataStore.hpp"

#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace stratus::db {

class MemoryStore : public MetadataStore {
public:
    types::FileRecord upsert(const types::FileRecord& record) override;
    std::optional<types::FileRecord> get(const types::DriveId& driveId, const std::filesystem::path& localPath) override;
    std::vector<types::FileRecord> listByDrive(const types::DriveId& driveId) override;
    std::vector<types::FileRecord> listUpdatedBetween(util::Timestamp from, util::Timestamp to) override;
    bool remove(const types::DriveId& driveId, const std::filesystem::path& localPath) override;
    size_t removeByDrive(const types::DriveId& driveId) override;

    void upsertSession(const types::UploadSession& session) override;
    std::optional<types::UploadSession> findSession(const types::DriveId& driveId, const std::filesystem::path& localPath) override;
    void removeSession(const std::string& sessionId) override;
    size_t purgeExpiredSessions(util::Timestamp now) override;

private:
    using Key = std::pair<types::DriveId, std::string>;

    mutable std::shared_mutex mutex_;
    std::map<Key, types::FileRecord> records_;
    std::unordered_map<std::string, types::UploadSession> sessions_;
};

}
