#include "sync/Mount.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>
#include <ranges>

using namespace stratus::sync;
using namespace stratus::concurrency;
using namespace stratus::types;

namespace {

std::string keyOf(const fs::path& path) { return path.lexically_normal().generic_string(); }

Reply take(Reply& reply) { return std::exchange(reply, nullptr); }

Reply& replyOf(MountCommand& cmd) {
    return std::visit([](auto& c) -> Reply& { return c.reply; }, cmd);
}

void resolve(const Reply& reply, const OpResult& result) {
    if (reply) reply->set_value(result);
}

std::future<OpResult> ready(const OpResult& result) {
    std::promise<OpResult> p;
    p.set_value(result);
    return p.get_future();
}

OpResult failureOf(const TaskResult& r) {
    return {false, r.error_kind.value_or(ErrorKind::TransferFailed), r.error};
}

auto stateUpdater(const PlaceholderState state) {
    return [state](FileRecord& rec) { rec.props["placeholder_state"] = to_string(state); };
}

// Applies a task's result JSON to the record.
auto resultUpdater(const nlohmann::json& result, const PlaceholderState state) {
    return [result, state](FileRecord& rec) {
        rec.remote_id = result.value("remote_id", rec.remote_id);
        rec.etag = result.value("etag", rec.etag);
        rec.size = result.value("size", rec.size);
        rec.is_folder = false;
        if (const auto hash = result.value("content_hash", std::string{}); !hash.empty())
            rec.metadata["content_hash"] = hash;
        rec.props["placeholder_state"] = to_string(state);
    };
}

auto remoteUpdater(const FileRecord& remote, const PlaceholderState state) {
    return [remote, state](FileRecord& rec) {
        rec.remote_id = remote.remote_id;
        rec.etag = remote.etag;
        rec.size = remote.size;
        rec.is_folder = remote.is_folder;
        rec.props["placeholder_state"] = to_string(state);
    };
}

}

fs::path stratus::sync::conflictCopyName(const fs::path& path, const std::time_t when) {
    const auto name = fmt::format("{} (conflict {}){}", path.stem().string(),
                                  util::compactLocalTimestamp(when), path.extension().string());
    return path.parent_path() / name;
}

Mount::Mount(DriveContextPtr ctx, std::shared_ptr<TaskManager> tasks, drive::EventFeedPtr events, IgnoreMatcher ignore)
    : AsyncService("Mount:" + (ctx ? ctx->drive_id : std::string{})),
      ctx_(std::move(ctx)),
      tasks_(std::move(tasks)),
      events_(std::move(events)),
      ignore_(std::move(ignore)) {
    if (!ctx_) throw std::invalid_argument("Mount requires a drive context");
    if (!tasks_) throw std::invalid_argument("Mount requires a task manager");
    if (!ctx_->store || !ctx_->backend || !ctx_->host || !ctx_->uploaded) throw std::invalid_argument("Incomplete drive context for " + ctx_->drive_id);
}

Mount::~Mount() { stop(); }

void Mount::start() {
    if (isRunning()) return;
    loadState();
    AsyncService::start();
    refreshHealth();
    log::Registry::mount()->info("[Mount] Drive {} mounted at {} ({} tracked paths)",
                                 ctx_->drive_id, ctx_->sync_root.string(), table_.size());
}

void Mount::stop() {
    if (!worker_.joinable()) return;
    AsyncService::stop();

    std::deque<MountCommand> rest;
    {
        std::scoped_lock lock(wakeMutex_);
        rest.swap(inbox_);
    }

    const auto stopped = OpResult::failure(ErrorKind::Cancelled, "Mount stopped");
    for (auto& cmd : rest) resolve(take(replyOf(cmd)), stopped);
    for (auto& replies : waiters_ | std::views::values)
        for (const auto& r : replies) resolve(r, stopped);
    waiters_.clear();

    // Completions of these tasks can no longer reach the inbox.
    inflight_.clear();
    uploads_.clear();
    reupload_.clear();
    refetch_.clear();
    inflightCount_ = 0;

    log::Registry::mount()->info("[Mount] Drive {} unmounted", ctx_->drive_id);
}

void Mount::loadState() {
    // Downloads finished after the last stop were never promoted.
    std::error_code ec;
    std::vector<fs::path> stale;
    if (!ctx_->staging_dir.empty() && fs::is_directory(ctx_->staging_dir, ec))
        for (const auto& entry : fs::directory_iterator(ctx_->staging_dir, ec))
            if (entry.path().extension() == ".part") stale.push_back(entry.path());
    for (const auto& p : stale) discardStaging(p);

    try {
        for (const auto& rec : ctx_->store->listByDrive(ctx_->drive_id)) {
            auto state = rec.is_folder ? PlaceholderState::Hydrated : PlaceholderState::Dehydrated;
            if (rec.props.contains("placeholder_state")) {
                state = placeholderStateFromString(rec.props.at("placeholder_state").get<std::string>());
                // Downloads do not survive a restart.
                if (state == PlaceholderState::Hydrating) state = PlaceholderState::Dehydrated;
            }
            table_.set(rec.local_path, state);
        }
        reloadNeeded_ = false;
    } catch (const Error& e) {
        if (e.kind() != ErrorKind::StoreUnavailable) throw;
        reloadNeeded_ = true;
        storeFailed_ = true;
        log::Registry::mount()->error("[Mount] Could not load metadata for drive {}: {}", ctx_->drive_id, e.what());
        return;
    }

    // Interrupted uploads resume from their persisted sessions.
    for (const auto& path : table_.inState(PlaceholderState::DirtyLocal)) {
        if (!ctx_->host->exists(path)) continue;
        try {
            submitUpload(path);
        } catch (const std::exception& e) {
            log::Registry::mount()->error("[Mount] Could not resume upload of {}: {}", path.string(), e.what());
        }
    }
}

std::future<OpResult> Mount::submit(MountCommand cmd) {
    auto promise = std::make_shared<std::promise<OpResult>>();
    auto future = promise->get_future();
    replyOf(cmd) = std::move(promise);
    post(std::move(cmd));
    return future;
}

void Mount::post(MountCommand cmd) {
    {
        std::scoped_lock lock(wakeMutex_);
        if (isRunning() && !interruptFlag_.load(std::memory_order_acquire)) {
            inbox_.push_back(std::move(cmd));
            wakeCv_.notify_one();
            return;
        }
    }
    log::Registry::mount()->debug("[Mount] Drive {} not running, rejecting {}", ctx_->drive_id, commandName(cmd));
    resolve(take(replyOf(cmd)), OpResult::failure(ErrorKind::Cancelled, "Mount is not running"));
}

std::future<OpResult> Mount::requestHydration(const fs::path& path) {
    const auto state = table_.get(path);
    if (state == PlaceholderState::Hydrated || state == PlaceholderState::DirtyLocal)
        return ready(OpResult::success());
    return submit(RequestHydration{path, nullptr});
}

std::future<OpResult> Mount::notifyLocalChange(const fs::path& path, const ChangeKind kind, const bool isFolder) {
    return submit(NotifyLocalChange{path, kind, isFolder, nullptr});
}

std::future<OpResult> Mount::notifyLocalRename(const fs::path& from, const fs::path& to) {
    return submit(NotifyLocalRename{from, to, nullptr});
}

std::future<OpResult> Mount::applyRemoteChange(FileRecord record, const bool deleted) {
    return submit(ApplyRemoteChange{std::move(record), deleted, nullptr});
}

std::future<OpResult> Mount::dehydrate(const fs::path& path) {
    return submit(Dehydrate{path, nullptr});
}

std::future<OpResult> Mount::resolveConflict(const fs::path& path, const Resolution resolution) {
    return submit(ResolveConflict{path, resolution, nullptr});
}

std::future<OpResult> Mount::refreshCredentials(Credentials credentials) {
    return submit(RefreshCredentials{std::move(credentials), nullptr});
}

std::future<OpResult> Mount::setPaused(const bool paused) {
    return submit(SetPaused{paused, nullptr});
}

void Mount::setEventPushLost(const bool lost) {
    pushLost_ = lost;
    refreshHealth();
}

std::optional<PlaceholderState> Mount::placeholderState(const fs::path& path) const {
    return table_.get(path);
}

std::vector<fs::path> Mount::conflicts() const {
    return table_.inState(PlaceholderState::Conflicted);
}

DriveHealth Mount::health() const {
    auto h = DriveHealth::Active;
    if (inflightCount_.load() > 0) h = mostSevere(h, DriveHealth::Syncing);
    if (paused_.load()) h = mostSevere(h, DriveHealth::Paused);
    if (transferFailed_.load() || storeFailed_.load() || pushLost_.load()) h = mostSevere(h, DriveHealth::Error);
    if (credentialExpired_.load()) h = mostSevere(h, DriveHealth::CredentialExpired);
    return h;
}

void Mount::refreshHealth() {
    const auto h = health();
    if (lastHealth_.exchange(h) == h) return;
    log::Registry::mount()->info("[Mount] Drive {} health is now {}", ctx_->drive_id, to_string(h));
    if (events_) events_->publish({drive::Event::Kind::DriveHealthChanged, ctx_->drive_id, {}, to_string(h), {}, {}});
}

void Mount::publish(const drive::Event::Kind kind, const fs::path& path, const std::string& message) const {
    if (!events_) return;
    events_->publish({kind, ctx_->drive_id, {}, {}, message, {{"path", path.generic_string()}}});
}

void Mount::runLoop() {
    while (true) {
        MountCommand cmd;
        {
            std::unique_lock lock(wakeMutex_);
            wakeCv_.wait(lock, [this] { return interruptFlag_.load(std::memory_order_acquire) || !inbox_.empty(); });
            if (interruptFlag_.load(std::memory_order_acquire)) return;
            cmd = std::move(inbox_.front());
            inbox_.pop_front();
        }

        dispatch(cmd);
        refreshHealth();
    }
}

void Mount::dispatch(MountCommand& cmd) {
    try {
        if (reloadNeeded_) loadState();
        flushUnsaved();
        std::visit([this](auto& c) { handle(c); }, cmd);
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::StoreUnavailable) storeFailed_ = true;
        log::Registry::mount()->warn("[Mount] {} on drive {} failed ({}): {}",
                                     commandName(cmd), ctx_->drive_id, to_string(e.kind()), e.what());
        resolve(take(replyOf(cmd)), OpResult::from(e));
    } catch (const std::exception& e) {
        log::Registry::mount()->error("[Mount] {} on drive {} failed: {}", commandName(cmd), ctx_->drive_id, e.what());
        resolve(take(replyOf(cmd)), {false, std::nullopt, e.what()});
    }
}

void Mount::requireActive(const fs::path& path) const {
    if (paused_.load()) throw Error(ErrorKind::DrivePaused, fmt::format("Drive {} is paused ({})", ctx_->drive_id, path.string()));
}

std::string Mount::submitTask(TaskPayload payload, const TaskPriority priority, const fs::path& path, const fs::path& dest) {
    const auto type = typeOf(payload);

    TaskSubmission submission;
    submission.payload = std::move(payload);
    submission.priority = priority;
    submission.metadata = {{"path", path.generic_string()}};
    submission.on_complete = [weak = weak_from_this()](const TaskResult& r) {
        if (const auto self = weak.lock()) self->post(TaskFinished{r, nullptr});
    };

    const auto id = tasks_->submit(std::move(submission));
    inflight_[id] = {type, path, dest};
    inflightCount_ = inflight_.size();
    return id;
}

void Mount::submitUpload(const fs::path& path) {
    const auto id = submitTask(UploadPayload{ctx_, path, path}, TaskPriority::Normal, path);
    uploads_[keyOf(path)] = id;
}

void Mount::cancelUpload(const std::string& key) {
    reupload_.erase(key);
    if (const auto it = uploads_.find(key); it != uploads_.end()) {
        tasks_->cancel(it->second);
        uploads_.erase(it);
    }
}

void Mount::resolveWaiters(const std::string& key, const OpResult& result) {
    const auto it = waiters_.find(key);
    if (it == waiters_.end()) return;
    for (const auto& r : it->second) resolve(r, result);
    waiters_.erase(it);
}

void Mount::handle(RequestHydration& c) {
    const auto key = keyOf(c.path);
    const auto state = table_.get(c.path);

    if (state == PlaceholderState::Hydrated || state == PlaceholderState::DirtyLocal)
        return resolve(take(c.reply), OpResult::success());

    requireActive(c.path);

    if (state == PlaceholderState::Conflicted)
        throw Error(ErrorKind::ConflictDetected, "Path is conflicted: " + c.path.string());

    if (state == PlaceholderState::Hydrating) {
        waiters_[key].push_back(take(c.reply));
        return;
    }

    const auto record = ctx_->store->get(ctx_->drive_id, c.path);
    if (!record) throw Error(ErrorKind::PathNotFound, "No metadata for " + c.path.string());

    if (record->is_folder) {
        table_.set(c.path, PlaceholderState::Hydrated);
        return resolve(take(c.reply), OpResult::success());
    }

    submitTask(DownloadPayload{ctx_, c.path, c.path}, TaskPriority::High, c.path);
    table_.set(c.path, PlaceholderState::Dehydrated);
    advance(c.path, PlaceholderEvent::HydrationRequested);
    waiters_[key].push_back(take(c.reply));

    log::Registry::mount()->debug("[Mount] Hydrating {} on drive {}", c.path.string(), ctx_->drive_id);
}

void Mount::handle(NotifyLocalChange& c) {
    const auto key = keyOf(c.path);

    if (ignore_.isIgnored(c.path, c.is_folder)) {
        log::Registry::mount()->trace("[Mount] Ignoring local change to {}", c.path.string());
        return resolve(take(c.reply), OpResult::success());
    }

    requireActive(c.path);

    const auto state = table_.get(c.path);
    if (state == PlaceholderState::Conflicted) {
        log::Registry::mount()->info("[Mount] {} is conflicted, local {} held back", c.path.string(), to_string(c.kind));
        return resolve(take(c.reply), OpResult::success());
    }

    if (c.kind == ChangeKind::Deleted) {
        if (!state && !ctx_->store->get(ctx_->drive_id, c.path))
            return resolve(take(c.reply), OpResult::success());

        cancelUpload(key);
        submitTask(DeletePayload{ctx_, c.path, c.path, true, false}, TaskPriority::Normal, c.path);
        table_.set(c.path, PlaceholderState::DirtyLocal);
        return resolve(take(c.reply), OpResult::success());
    }

    if (c.is_folder) {
        table_.set(c.path, PlaceholderState::Hydrated);
        const bool saved = persist(c.path, [](FileRecord& rec) {
            rec.is_folder = true;
            rec.props["placeholder_state"] = to_string(PlaceholderState::Hydrated);
        });
        return resolve(take(c.reply), saved ? OpResult::success()
                                            : OpResult::failure(ErrorKind::StoreUnavailable, "Metadata write deferred"));
    }

    if (state == PlaceholderState::Hydrating) {
        // Local content wins over the download still in flight.
        for (const auto& [id, f] : inflight_)
            if (f.type == TaskType::Download && keyOf(f.path) == key) tasks_->cancel(id);
        table_.set(c.path, PlaceholderState::DirtyLocal);
    } else {
        advance(c.path, PlaceholderEvent::LocalWrite);
    }

    if (uploads_.contains(key)) reupload_.insert(key);
    else submitUpload(c.path);

    if (state) persist(c.path, stateUpdater(PlaceholderState::DirtyLocal));
    resolve(take(c.reply), OpResult::success());
}

void Mount::handle(NotifyLocalRename& c) {
    requireActive(c.from);

    if (ignore_.isIgnored(c.to)) {
        log::Registry::mount()->debug("[Mount] {} renamed to ignored {}, treating as deletion", c.from.string(), c.to.string());
        NotifyLocalChange del{c.from, ChangeKind::Deleted, false, take(c.reply)};
        return handle(del);
    }

    if (!table_.get(c.from)) {
        // Never synced: the new name is simply a new file.
        NotifyLocalChange created{c.to, ChangeKind::Created, false, take(c.reply)};
        return handle(created);
    }

    cancelUpload(keyOf(c.from));
    submitTask(MovePayload{ctx_, c.from, c.to}, TaskPriority::Normal, c.from, c.to);
    resolve(take(c.reply), OpResult::success());
}

void Mount::handle(ApplyRemoteChange& c) {
    const auto& path = c.record.local_path;
    const auto key = keyOf(path);

    if (ignore_.isIgnored(path, c.record.is_folder)) return resolve(take(c.reply), OpResult::success());

    if (paused_.load()) {
        deferredRemote_[key] = {c.record, c.deleted};
        return resolve(take(c.reply), OpResult::success());
    }

    auto state = table_.get(path);

    if (c.deleted) {
        if (state == PlaceholderState::DirtyLocal || state == PlaceholderState::Conflicted) {
            cancelUpload(key);
            table_.set(path, PlaceholderState::Conflicted);
            remotePending_[key] = {c.record, true};
            publish(drive::Event::Kind::ConflictDetected, path, "Deleted remotely while modified locally");
            return resolve(take(c.reply), OpResult::success());
        }

        if (ctx_->host->exists(path)) ctx_->host->remove(path);
        table_.erase(path);
        ctx_->uploaded->forget(path);
        forget(path);
        return resolve(take(c.reply), OpResult::success());
    }

    const auto stored = ctx_->store->get(ctx_->drive_id, path);
    if (stored && stored->etag == c.record.etag) return resolve(take(c.reply), OpResult::success());

    if (ctx_->uploaded->isOwn(path, c.record.etag)) {
        log::Registry::mount()->debug("[Mount] Remote change of {} is our own upload ({})", path.string(), c.record.etag);
        return resolve(take(c.reply), OpResult::success());
    }

    if (!state && stored && stored->props.contains("placeholder_state"))
        state = placeholderStateFromString(stored->props.at("placeholder_state").get<std::string>());

    switch (state.value_or(PlaceholderState::Dehydrated)) {
        case PlaceholderState::DirtyLocal:
            cancelUpload(key);
            advance(path, PlaceholderEvent::RemoteChange);
            remotePending_[key] = {c.record, false};
            if (stored) persist(path, stateUpdater(PlaceholderState::Conflicted));
            publish(drive::Event::Kind::ConflictDetected, path, "Changed remotely while modified locally");
            log::Registry::mount()->warn("[Mount] Conflict on {} (drive {})", path.string(), ctx_->drive_id);
            break;
        case PlaceholderState::Conflicted:
            remotePending_[key] = {c.record, false};
            break;
        case PlaceholderState::Hydrating:
            refetch_.insert(key);
            break;
        case PlaceholderState::Hydrated:
            submitTask(DownloadPayload{ctx_, path, path}, TaskPriority::Normal, path);
            advance(path, PlaceholderEvent::RemoteChange);
            break;
        case PlaceholderState::Dehydrated:
            if (c.record.is_folder) {
                ctx_->host->createPlaceholder(path, 0, true);
                table_.set(path, PlaceholderState::Hydrated);
                persist(path, remoteUpdater(c.record, PlaceholderState::Hydrated));
                break;
            }
            submitTask(SyncPayload{ctx_, path, path}, TaskPriority::Normal, path);
            table_.set(path, PlaceholderState::Dehydrated);
            break;
    }

    resolve(take(c.reply), OpResult::success());
}

void Mount::handle(Dehydrate& c) {
    requireActive(c.path);

    const auto state = table_.get(c.path);
    if (state == PlaceholderState::Dehydrated) return resolve(take(c.reply), OpResult::success());
    if (state == PlaceholderState::Conflicted) throw Error(ErrorKind::ConflictDetected, "Path is conflicted: " + c.path.string());
    if (state != PlaceholderState::Hydrated)
        throw std::runtime_error(fmt::format("Cannot dehydrate {} while {}", c.path.string(),
                                             state ? to_string(*state) : "untracked"));

    const auto record = ctx_->store->get(ctx_->drive_id, c.path);
    if (!record) throw Error(ErrorKind::PathNotFound, "No metadata for " + c.path.string());
    if (record->is_folder) throw std::invalid_argument("Folders cannot be dehydrated: " + c.path.string());

    ctx_->host->dehydrate(c.path, record->size);
    advance(c.path, PlaceholderEvent::Dehydrated);
    const bool saved = persist(c.path, stateUpdater(PlaceholderState::Dehydrated));
    resolve(take(c.reply), saved ? OpResult::success()
                                 : OpResult::failure(ErrorKind::StoreUnavailable, "Metadata write deferred"));
}

void Mount::handle(ResolveConflict& c) {
    const auto key = keyOf(c.path);
    if (table_.get(c.path) != PlaceholderState::Conflicted)
        throw Error(ErrorKind::PathNotFound, "No conflict recorded for " + c.path.string());

    PendingRemote remote;
    if (const auto it = remotePending_.find(key); it != remotePending_.end()) remote = it->second;
    else if (const auto stored = ctx_->store->get(ctx_->drive_id, c.path)) remote = {*stored, false};
    else remote = {{}, true};
    remote.record.drive_id = ctx_->drive_id;
    remote.record.local_path = c.path;

    // Puts the remote version back as a placeholder at the original path.
    const auto restoreRemote = [&] {
        if (remote.deleted) {
            table_.erase(c.path);
            forget(c.path);
            return;
        }
        ctx_->host->createPlaceholder(c.path, remote.record.size, remote.record.is_folder);
        advance(c.path, PlaceholderEvent::ResolvedKeepRemote);
        persist(c.path, remoteUpdater(remote.record, PlaceholderState::Dehydrated));
    };

    switch (c.resolution) {
        case Resolution::KeepRemote:
            if (ctx_->host->exists(c.path)) ctx_->host->remove(c.path);
            restoreRemote();
            break;
        case Resolution::KeepLocal:
            advance(c.path, PlaceholderEvent::ResolvedKeepLocal);
            if (!remote.deleted) persist(c.path, remoteUpdater(remote.record, PlaceholderState::DirtyLocal));
            submitUpload(c.path);
            break;
        case Resolution::KeepBoth: {
            const auto copy = conflictCopyName(c.path, std::time(nullptr));
            ctx_->host->rename(c.path, copy);
            table_.set(copy, PlaceholderState::DirtyLocal);
            submitUpload(copy);
            restoreRemote();
            log::Registry::mount()->info("[Mount] Kept local copy of {} as {}", c.path.string(), copy.string());
            break;
        }
    }

    remotePending_.erase(key);
    publish(drive::Event::Kind::ConflictResolved, c.path, to_string(c.resolution));
    resolve(take(c.reply), OpResult::success());
}

void Mount::handle(RefreshCredentials& c) {
    if (c.credentials.isExpired()) {
        credentialExpired_ = true;
        throw Error(ErrorKind::InvalidCredential, "Refreshed credentials for drive " + ctx_->drive_id + " are already expired");
    }
    credentialExpired_ = false;
    log::Registry::mount()->info("[Mount] Credentials refreshed for drive {}", ctx_->drive_id);
    resolve(take(c.reply), OpResult::success());
}

void Mount::handle(SetPaused& c) {
    paused_ = c.paused;
    log::Registry::mount()->info("[Mount] Drive {} {}", ctx_->drive_id, c.paused ? "paused" : "resumed");

    if (!c.paused && !deferredRemote_.empty()) {
        auto deferred = std::move(deferredRemote_);
        deferredRemote_.clear();
        for (auto& [key, pending] : deferred) {
            ApplyRemoteChange change{std::move(pending.record), pending.deleted, nullptr};
            handle(change);
        }
    }
    resolve(take(c.reply), OpResult::success());
}

void Mount::handle(TaskFinished& c) {
    const auto& r = c.result;
    const auto it = inflight_.find(r.task_id);
    if (it == inflight_.end()) {
        log::Registry::mount()->debug("[Mount] Ignoring completion of unknown task {}", r.task_id);
        return resolve(take(c.reply), OpResult::success());
    }

    const auto f = it->second;
    inflight_.erase(it);
    inflightCount_ = inflight_.size();

    if (r.ok() && inflight_.empty() && unsaved_.empty()) transferFailed_ = false;

    switch (f.type) {
        case TaskType::Download: onDownloadFinished(f, r); break;
        case TaskType::Upload: onUploadFinished(f, r); break;
        case TaskType::Sync: onSyncFinished(f, r); break;
        case TaskType::Delete: onDeleteFinished(f, r); break;
        case TaskType::Move: onMoveFinished(f, r); break;
        default:
            log::Registry::mount()->debug("[Mount] {} task {} finished as {}", to_string(f.type), r.task_id, to_string(r.status));
            break;
    }
    resolve(take(c.reply), OpResult::success());
}

void Mount::noteFailure(const TaskResult& r) {
    if (r.status == TaskStatus::Cancelled) return;
    if (r.error_kind == ErrorKind::InvalidCredential) credentialExpired_ = true;
    else transferFailed_ = true;
}

void Mount::onDownloadFinished(const InFlight& f, const TaskResult& r) {
    const auto key = keyOf(f.path);
    const fs::path staging = r.ok() ? r.result.value("staging_path", std::string{}) : std::string{};

    if (table_.get(f.path) != PlaceholderState::Hydrating) {
        // Superseded by a local write while in flight. The local content stays.
        discardStaging(staging);
        resolveWaiters(key, OpResult::failure(ErrorKind::Cancelled, "Hydration superseded by local change"));
        refetch_.erase(key);
        return;
    }

    auto failure = r.ok() ? std::optional<OpResult>{} : std::optional<OpResult>{failureOf(r)};
    if (!failure) {
        try {
            if (staging.empty()) throw std::runtime_error("Download of " + f.path.string() + " reported no staging file");
            ctx_->host->commitHydration(staging, f.path);
        } catch (const std::exception& e) {
            discardStaging(staging);
            transferFailed_ = true;
            failure = OpResult::failure(ErrorKind::TransferFailed, e.what());
        }
    } else {
        noteFailure(r);
    }

    if (failure) {
        advance(f.path, PlaceholderEvent::DownloadFailed);
        refetch_.erase(key);
        log::Registry::mount()->warn("[Mount] Hydration of {} failed: {}", f.path.string(), failure->message);
        resolveWaiters(key, *failure);
        return;
    }

    advance(f.path, PlaceholderEvent::DownloadSucceeded);
    const bool saved = persist(f.path, resultUpdater(r.result, PlaceholderState::Hydrated));
    resolveWaiters(key, saved ? OpResult::success()
                              : OpResult::failure(ErrorKind::StoreUnavailable, "Hydrated but metadata write deferred"));

    if (refetch_.erase(key)) {
        submitTask(DownloadPayload{ctx_, f.path, f.path}, TaskPriority::Normal, f.path);
        advance(f.path, PlaceholderEvent::RemoteChange);
    }
}

void Mount::onUploadFinished(const InFlight& f, const TaskResult& r) {
    const auto key = keyOf(f.path);
    if (const auto it = uploads_.find(key); it != uploads_.end() && it->second == r.task_id) uploads_.erase(it);

    const auto state = table_.get(f.path);
    if (state == PlaceholderState::Conflicted) {
        log::Registry::mount()->info("[Mount] Upload of conflicted {} ended as {}, awaiting resolution",
                                     f.path.string(), to_string(r.status));
        return;
    }

    if (reupload_.erase(key)) {
        // The remote now holds this upload's version; the stored tag has to follow it.
        if (r.ok()) persist(f.path, resultUpdater(r.result, PlaceholderState::DirtyLocal));
        submitUpload(f.path);
        return;
    }

    if (!r.ok()) {
        noteFailure(r);
        if (r.status != TaskStatus::Cancelled)
            log::Registry::mount()->warn("[Mount] Upload of {} failed, retried on next change: {}", f.path.string(), r.error);
        return;
    }

    advance(f.path, PlaceholderEvent::UploadSucceeded);
    persist(f.path, resultUpdater(r.result, PlaceholderState::Hydrated));
}

void Mount::onSyncFinished(const InFlight& f, const TaskResult& r) {
    if (!r.ok()) {
        noteFailure(r);
        log::Registry::mount()->warn("[Mount] Sync of {} failed: {}", f.path.string(), r.error);
        return;
    }

    auto state = table_.get(f.path);
    if (!state) {
        state = PlaceholderState::Dehydrated;
        table_.set(f.path, *state);
    }
    persist(f.path, resultUpdater(r.result, *state));
}

void Mount::onDeleteFinished(const InFlight& f, const TaskResult& r) {
    if (!r.ok()) {
        noteFailure(r);
        log::Registry::mount()->warn("[Mount] Delete of {} failed: {}", f.path.string(), r.error);
        return;
    }
    if (table_.get(f.path) == PlaceholderState::DirtyLocal) table_.erase(f.path);
    ctx_->uploaded->forget(f.path);
    forget(f.path);
}

void Mount::onMoveFinished(const InFlight& f, const TaskResult& r) {
    if (!r.ok()) {
        noteFailure(r);
        log::Registry::mount()->warn("[Mount] Move of {} to {} failed: {}", f.path.string(), f.dest.string(), r.error);
        return;
    }

    const auto state = table_.get(f.path).value_or(PlaceholderState::Hydrated);
    table_.erase(f.path);
    table_.set(f.dest, state);
    ctx_->uploaded->forget(f.path);
    forget(f.path);
    persist(f.dest, resultUpdater(r.result, state));
}

bool Mount::persist(const fs::path& path, Updater update) {
    const auto key = keyOf(path);
    auto& pending = unsaved_[key];
    pending.erase = false;
    pending.updates.push_back(std::move(update));
    return flush(key);
}

bool Mount::forget(const fs::path& path) {
    const auto key = keyOf(path);
    auto& pending = unsaved_[key];
    pending.erase = true;
    pending.updates.clear();
    return flush(key);
}

bool Mount::flush(const std::string& key) {
    const auto it = unsaved_.find(key);
    if (it == unsaved_.end()) return true;

    try {
        if (it->second.erase) {
            ctx_->store->remove(ctx_->drive_id, key);
        } else {
            FileRecord rec;
            if (auto existing = ctx_->store->get(ctx_->drive_id, key)) rec = std::move(*existing);
            rec.drive_id = ctx_->drive_id;
            rec.local_path = key;
            for (const auto& u : it->second.updates) u(rec);
            ctx_->store->upsert(rec);
        }
    } catch (const Error& e) {
        if (e.kind() != ErrorKind::StoreUnavailable) {
            unsaved_.erase(it);
            throw;
        }
        storeFailed_ = true;
        log::Registry::mount()->warn("[Mount] Metadata write for {} on drive {} deferred: {}", key, ctx_->drive_id, e.what());
        return false;
    }

    unsaved_.erase(it);
    if (unsaved_.empty()) storeFailed_ = reloadNeeded_;
    return true;
}

void Mount::flushUnsaved() {
    if (unsaved_.empty()) return;

    std::vector<std::string> keys;
    keys.reserve(unsaved_.size());
    for (const auto& key : unsaved_ | std::views::keys) keys.push_back(key);

    for (const auto& key : keys)
        if (!flush(key)) return;

    log::Registry::mount()->info("[Mount] Deferred metadata writes for drive {} flushed", ctx_->drive_id);
}

void Mount::advance(const fs::path& path, const PlaceholderEvent event) {
    const auto before = table_.get(path);
    if (!table_.apply(path, event))
        log::Registry::mount()->warn("[Mount] Rejected placeholder transition of {}: {} while {}", path.string(),
                                     to_string(event), before ? to_string(*before) : "untracked");
}

void Mount::discardStaging(const fs::path& staging) {
    if (staging.empty()) return;
    std::error_code ec;
    fs::remove(staging, ec);
    if (ec) log::Registry::mount()->warn("[Mount] Could not remove staging file {}: {}", staging.string(), ec.message());
}
