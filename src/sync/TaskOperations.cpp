#include "sync/TaskOperations.hpp"
#include "sync/DriveContext.hpp"
#include "transfer/ChunkedDownloader.hpp"
#include "transfer/ChunkedUploader.hpp"
#include "log/Registry.hpp"
#include "types/Error.hpp"

using namespace stratus::sync;
using namespace stratus::concurrency;
using namespace stratus::transfer;
using namespace stratus::types;

namespace {

void throwIfCancelled(const TaskContext& ctx) {
    if (ctx.isCancelled()) throw Error(ErrorKind::Cancelled, "Task " + ctx.taskId() + " cancelled before start");
}

const DriveContext& driveOf(const DriveContextPtr& drive) {
    if (!drive) throw std::invalid_argument("Task payload carries no drive context");
    return *drive;
}

nlohmann::json objectJson(const RemoteObject& o) {
    return {
        {"remote_id", o.remote_id},
        {"remote_path", o.path.generic_string()},
        {"etag", o.etag},
        {"size", o.size},
        {"content_hash", o.attributes.contains(attr::CONTENT_HASH) ? o.attributes.at(attr::CONTENT_HASH) : ""}
    };
}

uintmax_t logicalSize(const RemoteObject& o) {
    if (const auto it = o.attributes.find(attr::PLAIN_SIZE); it != o.attributes.end()) return std::stoull(it->second);
    return o.size;
}

}

namespace stratus::sync::ops {

nlohmann::json upload(const UploadPayload& p, TaskContext& ctx) {
    const auto& d = driveOf(p.drive);
    throwIfCancelled(ctx);

    const ChunkedUploader uploader(d.backend, d.store, d.transfer, d.encryption_key);
    const auto res = uploader.upload({d.drive_id, ctx.taskId(), d.host->localPath(p.local_path), p.local_path, p.remote_path},
                                     ctx.token(),
                                     [&ctx](const uintmax_t done, const uintmax_t total) { ctx.reportProgress(done, total); });
    d.uploaded->record(p.local_path, res.object.etag);

    auto j = objectJson(res.object);
    j["content_hash"] = res.content_hash;
    j["size"] = res.bytes;
    j["resumed"] = res.resumed;
    j["chunks_sent"] = res.chunks_sent;
    return j;
}

nlohmann::json download(const DownloadPayload& p, TaskContext& ctx) {
    const auto& d = driveOf(p.drive);
    throwIfCancelled(ctx);

    std::filesystem::create_directories(d.staging_dir);
    const auto staging = d.staging_dir / (ctx.taskId() + ".part");

    const ChunkedDownloader downloader(d.backend, d.transfer, d.encryption_key);
    const auto res = downloader.download({p.remote_path, staging}, ctx.token(),
                                         [&ctx](const uintmax_t done, const uintmax_t total) { ctx.reportProgress(done, total); });

    // Verified but not yet visible. The mount promotes it only if the path is still hydrating.
    auto j = objectJson(res.object);
    j["content_hash"] = res.content_hash;
    j["size"] = res.bytes;
    j["staging_path"] = res.staging_path.string();
    return j;
}

nlohmann::json sync(const SyncPayload& p, TaskContext& ctx) {
    const auto& d = driveOf(p.drive);
    throwIfCancelled(ctx);

    const auto object = d.backend->stat(p.remote_path);
    if (!object) throw Error(ErrorKind::PathNotFound, "Remote object not found: " + p.remote_path.string());

    const auto size = logicalSize(*object);
    d.host->createPlaceholder(p.local_path, size, false);

    auto j = objectJson(*object);
    j["size"] = size;
    return j;
}

nlohmann::json remove(const DeletePayload& p, TaskContext& ctx) {
    const auto& d = driveOf(p.drive);
    throwIfCancelled(ctx);

    bool removedRemote = false, removedLocal = false;
    if (p.delete_remote) removedRemote = d.backend->remove(p.remote_path);
    if (p.delete_local) removedLocal = d.host->remove(p.local_path);

    if (const auto session = d.store->findSession(d.drive_id, p.local_path)) {
        d.store->removeSession(session->id);
        log::Registry::transfer()->debug("[TaskOperations] Dropped upload session {} of deleted {}",
                                         session->id, p.local_path.string());
    }

    return {{"removed_remote", removedRemote}, {"removed_local", removedLocal}};
}

nlohmann::json copy(const CopyPayload& p, TaskContext& ctx) {
    const auto& d = driveOf(p.drive);
    throwIfCancelled(ctx);
    auto j = objectJson(d.backend->copy(p.from, p.to));
    j["from"] = p.from.generic_string();
    return j;
}

nlohmann::json move(const MovePayload& p, TaskContext& ctx) {
    const auto& d = driveOf(p.drive);
    throwIfCancelled(ctx);

    const auto object = d.backend->move(p.from, p.to);
    if (d.host->exists(p.from) && !d.host->exists(p.to)) d.host->rename(p.from, p.to);

    auto j = objectJson(object);
    j["from"] = p.from.generic_string();
    return j;
}

}

OperationTable stratus::sync::makeOperationTable() {
    OperationTable table;
    table.upload = ops::upload;
    table.download = ops::download;
    table.sync = ops::sync;
    table.remove = ops::remove;
    table.copy = ops::copy;
    table.move = ops::move;
    return table;
}
