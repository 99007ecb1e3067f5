#include "db/PgStore.hpp"
#include "db/Schema.hpp"
#include "db/Transactions.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace stratus::db;
using namespace stratus::types;
using namespace stratus::util;

namespace {

FileRecord recordFromRow(const pqxx::row& row) {
    FileRecord r;
    r.drive_id = row["drive_id"].as<std::string>();
    r.local_path = row["local_path"].as<std::string>();
    r.remote_id = row["remote_id"].as<std::string>();
    r.is_folder = row["is_folder"].as<bool>();
    r.etag = row["etag"].as<std::string>();
    r.size = row["size"].as<uintmax_t>();
    r.permissions = row["permissions"].as<std::string>();
    r.shared = row["shared"].as<bool>();
    r.created_at = fromMicros(row["created_at"].as<int64_t>());
    r.updated_at = fromMicros(row["updated_at"].as<int64_t>());
    r.metadata = nlohmann::json::parse(row["metadata"].as<std::string>());
    r.props = nlohmann::json::parse(row["props"].as<std::string>());
    return r;
}

std::vector<FileRecord> recordsFromResult(const pqxx::result& res) {
    std::vector<FileRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(recordFromRow(row));
    return out;
}

UploadSession sessionFromRow(const pqxx::row& row) {
    UploadSession s;
    s.id = row["id"].as<std::string>();
    s.task_id = row["task_id"].as<std::string>();
    s.drive_id = row["drive_id"].as<std::string>();
    s.local_path = row["local_path"].as<std::string>();
    s.remote_path = row["remote_path"].as<std::string>();
    s.token = row["token"].as<std::string>();
    s.file_size = row["file_size"].as<uintmax_t>();
    s.chunk_size = row["chunk_size"].as<uintmax_t>();
    s.chunks = nlohmann::json::parse(row["chunk_progress"].as<std::string>()).get<std::vector<ChunkProgress>>();
    s.content_hash = row["content_hash"].as<std::string>();
    s.cipher_suite = row["cipher_suite"].as<std::string>();
    s.cipher_nonce = row["cipher_nonce"].as<std::string>();
    s.expires_at = fromMicros(row["expires_at"].as<int64_t>());
    s.created_at = fromMicros(row["created_at"].as<int64_t>());
    s.updated_at = fromMicros(row["updated_at"].as<int64_t>());
    return s;
}

}

std::shared_ptr<PgStore> PgStore::connect(const config::DatabaseConfig& cfg) {
    try {
        Transactions::init(cfg);
    } catch (const pqxx::broken_connection& e) {
        throw Error(ErrorKind::StoreUnavailable, std::string("Unable to reach database: ") + e.what());
    }

    initTables();
    Transactions::dbPool_->initPreparedStatements();

    log::Registry::db()->info("[PgStore] Connected to {}:{}/{}", cfg.host, cfg.port, cfg.name);
    return std::make_shared<PgStore>();
}

FileRecord PgStore::upsert(const FileRecord& record) {
    return Transactions::exec("PgStore::upsert", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(record.drive_id);
        p.append(record.local_path.generic_string());
        p.append(record.remote_id);
        p.append(record.is_folder);
        p.append(record.etag);
        p.append(static_cast<int64_t>(record.size));
        p.append(record.permissions);
        p.append(record.shared);
        p.append(toMicros(Clock::now()));
        p.append(record.metadata.dump());
        p.append(record.props.dump());

        return recordFromRow(txn.exec(pqxx::prepped{"upsert_file_metadata"}, p).one_row());
    });
}

std::optional<FileRecord> PgStore::get(const DriveId& driveId, const std::filesystem::path& localPath) {
    return Transactions::exec("PgStore::get", [&](pqxx::work& txn) -> std::optional<FileRecord> {
        const auto res = txn.exec(pqxx::prepped{"get_file_metadata"},
                                  pqxx::params{driveId, localPath.generic_string()});
        if (res.empty()) return std::nullopt;
        return recordFromRow(res.one_row());
    });
}

std::vector<FileRecord> PgStore::listByDrive(const DriveId& driveId) {
    return Transactions::exec("PgStore::listByDrive", [&](pqxx::work& txn) {
        return recordsFromResult(txn.exec(pqxx::prepped{"list_file_metadata_by_drive"}, pqxx::params{driveId}));
    });
}

std::vector<FileRecord> PgStore::listUpdatedBetween(const Timestamp from, const Timestamp to) {
    return Transactions::exec("PgStore::listUpdatedBetween", [&](pqxx::work& txn) {
        return recordsFromResult(txn.exec(pqxx::prepped{"list_file_metadata_updated_between"},
                                          pqxx::params{toMicros(from), toMicros(to)}));
    });
}

bool PgStore::remove(const DriveId& driveId, const std::filesystem::path& localPath) {
    return Transactions::exec("PgStore::remove", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"delete_file_metadata"},
                                  pqxx::params{driveId, localPath.generic_string()});
        return res.affected_rows() > 0;
    });
}

size_t PgStore::removeByDrive(const DriveId& driveId) {
    return Transactions::exec("PgStore::removeByDrive", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_upload_sessions_by_drive"}, pqxx::params{driveId});
        const auto res = txn.exec(pqxx::prepped{"delete_file_metadata_by_drive"}, pqxx::params{driveId});
        return static_cast<size_t>(res.affected_rows());
    });
}

void PgStore::upsertSession(const UploadSession& session) {
    Transactions::exec("PgStore::upsertSession", [&](pqxx::work& txn) {
        const nlohmann::json chunks = session.chunks;

        pqxx::params p;
        p.append(session.id);
        p.append(session.task_id);
        p.append(session.drive_id);
        p.append(session.local_path.generic_string());
        p.append(session.remote_path.generic_string());
        p.append(session.token);
        p.append(static_cast<int64_t>(session.file_size));
        p.append(static_cast<int64_t>(session.chunk_size));
        p.append(chunks.dump());
        p.append(session.content_hash);
        p.append(session.cipher_suite);
        p.append(session.cipher_nonce);
        p.append(toMicros(session.expires_at));
        p.append(toMicros(session.created_at));
        p.append(toMicros(Clock::now()));

        txn.exec(pqxx::prepped{"upsert_upload_session"}, p);
    });
}

std::optional<UploadSession> PgStore::findSession(const DriveId& driveId, const std::filesystem::path& localPath) {
    return Transactions::exec("PgStore::findSession", [&](pqxx::work& txn) -> std::optional<UploadSession> {
        const auto res = txn.exec(pqxx::prepped{"find_upload_session"},
                                  pqxx::params{driveId, localPath.generic_string()});
        if (res.empty()) return std::nullopt;
        return sessionFromRow(res.one_row());
    });
}

void PgStore::removeSession(const std::string& sessionId) {
    Transactions::exec("PgStore::removeSession", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_upload_session"}, pqxx::params{sessionId});
    });
}

size_t PgStore::purgeExpiredSessions(const Timestamp now) {
    return Transactions::exec("PgStore::purgeExpiredSessions", [&](pqxx::work& txn) {
        const auto res = txn.exec("DELETE FROM upload_sessions WHERE expires_at <= " + txn.quote(toMicros(now)));
        return static_cast<size_t>(res.affected_rows());
    });
}
