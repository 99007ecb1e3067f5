#pragma once

#include "db/MetadataStore.hpp"
#include "config/Config.hpp"

namespace stratus::db {

// PostgreSQL-backed store. Requires Transactions::init() and the schema to exist.
class PgStore : public MetadataStore {
public:
    // Opens the connection pool, creates tables if needed and prepares statements.
    static std::shared_ptr<PgStore> connect(const config::DatabaseConfig& cfg);

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
};

}
