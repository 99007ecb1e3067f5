#include "db/DBConnection.hpp"

void stratus::db::DBConnection::initPreparedFileMetadata() const {
    conn_->prepare("upsert_file_metadata",
                   R"(INSERT INTO file_metadata (drive_id, local_path, remote_id, is_folder, etag, size,
                                     permissions, shared, created_at, updated_at, metadata, props)
       VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $9, $10::jsonb, $11::jsonb)
       ON CONFLICT (drive_id, local_path)
       DO UPDATE SET
           remote_id = EXCLUDED.remote_id,
           is_folder = EXCLUDED.is_folder,
           etag = EXCLUDED.etag,
           size = EXCLUDED.size,
           permissions = EXCLUDED.permissions,
           shared = EXCLUDED.shared,
           metadata = EXCLUDED.metadata,
           props = EXCLUDED.props,
           updated_at = GREATEST(EXCLUDED.updated_at, file_metadata.updated_at + 1)
       RETURNING *)");

    conn_->prepare("get_file_metadata", "SELECT * FROM file_metadata WHERE drive_id = $1 AND local_path = $2");

    conn_->prepare("list_file_metadata_by_drive",
                   "SELECT * FROM file_metadata WHERE drive_id = $1 ORDER BY local_path");

    conn_->prepare("list_file_metadata_updated_between",
                   "SELECT * FROM file_metadata WHERE updated_at >= $1 AND updated_at < $2 ORDER BY updated_at");

    conn_->prepare("delete_file_metadata", "DELETE FROM file_metadata WHERE drive_id = $1 AND local_path = $2");

    conn_->prepare("delete_file_metadata_by_drive", "DELETE FROM file_metadata WHERE drive_id = $1");
}
