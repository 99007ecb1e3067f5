#pragma once

#include "concurrency/OperationTable.hpp"

namespace stratus::sync {

// Executors for the built-in task types. They move content and touch the backend and the
// placeholder host only; metadata records are written by the owning Mount when a task finishes.
concurrency::OperationTable makeOperationTable();

namespace ops {

nlohmann::json upload(const concurrency::UploadPayload& p, concurrency::TaskContext& ctx);
nlohmann::json download(const concurrency::DownloadPayload& p, concurrency::TaskContext& ctx);
nlohmann::json sync(const concurrency::SyncPayload& p, concurrency::TaskContext& ctx);
nlohmann::json remove(const concurrency::DeletePayload& p, concurrency::TaskContext& ctx);
nlohmann::json copy(const concurrency::CopyPayload& p, concurrency::TaskContext& ctx);
nlohmann::json move(const concurrency::MovePayload& p, concurrency::TaskContext& ctx);

}

}
