#include "db/DBConnection.hpp"

void stratus::db::DBConnection::initPreparedUploadSessions() const {
    conn_->prepare("upsert_upload_session",
                   R"(INSERT INTO upload_sessions (id, task_id, drive_id, local_path, remote_path, token,
                                       file_size, chunk_size, chunk_progress, content_hash,
                                       cipher_suite, cipher_nonce, expires_at, created_at, updated_at)
       VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9::jsonb, $10, $11, $12, $13, $14, $15)
       ON CONFLICT (id)
       DO UPDATE SET
           task_id = EXCLUDED.task_id,
           token = EXCLUDED.token,
           chunk_progress = EXCLUDED.chunk_progress,
           expires_at = EXCLUDED.expires_at,
           updated_at = EXCLUDED.updated_at)");

    conn_->prepare("find_upload_session",
                   "SELECT * FROM upload_sessions WHERE drive_id = $1 AND local_path = $2 "
                   "ORDER BY updated_at DESC LIMIT 1");

    conn_->prepare("delete_upload_session", "DELETE FROM upload_sessions WHERE id = $1");

    conn_->prepare("delete_upload_sessions_by_drive", "DELETE FROM upload_sessions WHERE drive_id = $1");
}
