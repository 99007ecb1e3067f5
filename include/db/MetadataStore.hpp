#pragma once

#include "types/FileRecord.hpp"
#include "types/UploadSession.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace stratus::db {

// Persistence contract for per-path sync metadata and in-flight upload sessions.
// Implementations are safe for concurrent callers and make each write atomic.
// Failures to reach the backing store surface as types::Error(StoreUnavailable).
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    // Inserts or replaces the record keyed by (drive_id, local_path). created_at is preserved
    // for existing rows; updated_at strictly increases. Returns the stored row.
    virtual types::FileRecord upsert(const types::FileRecord& record) = 0;

    [[nodiscard]] virtual std::optional<types::FileRecord> get(const types::DriveId& driveId,
                                                               const std::filesystem::path& localPath) = 0;

    [[nodiscard]] virtual std::vector<types::FileRecord> listByDrive(const types::DriveId& driveId) = 0;

    // Records whose updated_at lies in [from, to).
    [[nodiscard]] virtual std::vector<types::FileRecord> listUpdatedBetween(util::Timestamp from, util::Timestamp to) = 0;

    virtual bool remove(const types::DriveId& driveId, const std::filesystem::path& localPath) = 0;

    virtual size_t removeByDrive(const types::DriveId& driveId) = 0;

    virtual void upsertSession(const types::UploadSession& session) = 0;

    [[nodiscard]] virtual std::optional<types::UploadSession> findSession(const types::DriveId& driveId,
                                                                          const std::filesystem::path& localPath) = 0;

    virtual void removeSession(const std::string& sessionId) = 0;

    // Drops sessions whose expires_at is at or before now. Returns how many were removed.
    virtual size_t purgeExpiredSessions(util::Timestamp now) = 0;
};

using MetadataStorePtr = std::shared_ptr<MetadataStore>;

}
