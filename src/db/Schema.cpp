#include "db/Schema.hpp"
#include "db/Transactions.hpp"

void stratus::db::initTables() {
    Transactions::exec("Schema::initTables", [](pqxx::work& txn) {
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS file_metadata (
                id          BIGSERIAL PRIMARY KEY,
                drive_id    TEXT NOT NULL,
                local_path  TEXT NOT NULL,
                remote_id   TEXT NOT NULL DEFAULT '',
                is_folder   BOOLEAN NOT NULL DEFAULT FALSE,
                etag        TEXT NOT NULL DEFAULT '',
                size        BIGINT NOT NULL DEFAULT 0,
                permissions TEXT NOT NULL DEFAULT '',
                shared      BOOLEAN NOT NULL DEFAULT FALSE,
                created_at  BIGINT NOT NULL,
                updated_at  BIGINT NOT NULL,
                metadata    JSONB NOT NULL DEFAULT '{}'::jsonb,
                props       JSONB NOT NULL DEFAULT '{}'::jsonb,
                UNIQUE (drive_id, local_path)
            ))");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_file_metadata_updated_at ON file_metadata (updated_at)");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS upload_sessions (
                id             TEXT PRIMARY KEY,
                task_id        TEXT NOT NULL DEFAULT '',
                drive_id       TEXT NOT NULL,
                local_path     TEXT NOT NULL,
                remote_path    TEXT NOT NULL,
                token          TEXT NOT NULL,
                file_size      BIGINT NOT NULL,
                chunk_size     BIGINT NOT NULL,
                chunk_progress JSONB NOT NULL DEFAULT '[]'::jsonb,
                content_hash   TEXT NOT NULL DEFAULT '',
                cipher_suite   TEXT NOT NULL DEFAULT '',
                cipher_nonce   TEXT NOT NULL DEFAULT '',
                expires_at     BIGINT NOT NULL,
                created_at     BIGINT NOT NULL,
                updated_at     BIGINT NOT NULL
            ))");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_upload_sessions_drive_path ON upload_sessions (drive_id, local_path)");
    });
}
