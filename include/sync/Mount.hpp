#pragma once

#include "concurrency/AsyncService.hpp"
#include "concurrency/TaskManager.hpp"
#include "drive/EventFeed.hpp"
#include "sync/DriveContext.hpp"
#include "sync/IgnoreMatcher.hpp"
#include "sync/MountCommand.hpp"
#include "sync/PlaceholderState.hpp"

#include <atomic>
#include <ctime>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace stratus::sync {

// "<stem> (conflict YYYYmmddHHMMSS)<ext>" beside the original.
fs::path conflictCopyName(const fs::path& path, std::time_t when);

// One drive's sync surface. Commands are applied one at a time on the mount's own thread, in
// submission order. The mount is the only writer of its drive's metadata records and of its
// placeholder table; task executors report back through TaskFinished.
class Mount final : public concurrency::AsyncService, public std::enable_shared_from_this<Mount> {
public:
    Mount(DriveContextPtr ctx, std::shared_ptr<concurrency::TaskManager> tasks,
          drive::EventFeedPtr events = nullptr, IgnoreMatcher ignore = IgnoreMatcher());

    ~Mount() override;

    // Loads placeholder states from the store, resumes interrupted uploads, then starts the inbox.
    void start() override;

    // Pending replies resolve as Cancelled.
    void stop() override;

    std::future<types::OpResult> submit(MountCommand cmd);
    void post(MountCommand cmd);

    // Resolves immediately, without queueing, when the content is already local.
    std::future<types::OpResult> requestHydration(const fs::path& path);
    std::future<types::OpResult> notifyLocalChange(const fs::path& path, ChangeKind kind, bool isFolder = false);
    std::future<types::OpResult> notifyLocalRename(const fs::path& from, const fs::path& to);
    std::future<types::OpResult> applyRemoteChange(types::FileRecord record, bool deleted = false);
    std::future<types::OpResult> dehydrate(const fs::path& path);
    std::future<types::OpResult> resolveConflict(const fs::path& path, Resolution resolution);
    std::future<types::OpResult> refreshCredentials(types::Credentials credentials);
    std::future<types::OpResult> setPaused(bool paused);

    void setEventPushLost(bool lost);

    [[nodiscard]] std::optional<PlaceholderState> placeholderState(const fs::path& path) const;
    [[nodiscard]] std::vector<fs::path> conflicts() const;
    [[nodiscard]] types::DriveHealth health() const;
    [[nodiscard]] bool isPaused() const { return paused_.load(); }
    [[nodiscard]] size_t inflightCount() const { return inflightCount_.load(); }
    [[nodiscard]] const types::DriveId& driveId() const { return ctx_->drive_id; }
    [[nodiscard]] const DriveContextPtr& context() const { return ctx_; }

protected:
    void runLoop() override;

private:
    using Updater = std::function<void(types::FileRecord&)>;

    struct InFlight {
        concurrency::TaskType type;
        fs::path path;
        fs::path dest;
    };

    struct PendingRemote {
        types::FileRecord record;
        bool deleted = false;
    };

    struct PendingWrite {
        bool erase = false;
        std::vector<Updater> updates;
    };

    DriveContextPtr ctx_;
    std::shared_ptr<concurrency::TaskManager> tasks_;
    drive::EventFeedPtr events_;
    IgnoreMatcher ignore_;
    PlaceholderTable table_;

    // Guarded by wakeMutex_.
    std::deque<MountCommand> inbox_;

    // Mount thread only.
    std::unordered_map<std::string, InFlight> inflight_;
    std::unordered_map<std::string, std::vector<Reply>> waiters_;
    std::unordered_map<std::string, std::string> uploads_;
    std::unordered_set<std::string> reupload_;
    std::unordered_set<std::string> refetch_;
    std::unordered_map<std::string, PendingRemote> remotePending_;
    std::unordered_map<std::string, PendingRemote> deferredRemote_;
    std::unordered_map<std::string, PendingWrite> unsaved_;
    bool reloadNeeded_ = false;

    std::atomic<bool> paused_{false};
    std::atomic<bool> credentialExpired_{false};
    std::atomic<bool> pushLost_{false};
    std::atomic<bool> transferFailed_{false};
    std::atomic<bool> storeFailed_{false};
    std::atomic<size_t> inflightCount_{0};
    std::atomic<types::DriveHealth> lastHealth_{types::DriveHealth::Active};

    void dispatch(MountCommand& cmd);
    void refreshHealth();
    void publish(drive::Event::Kind kind, const fs::path& path, const std::string& message) const;

    void handle(RequestHydration& c);
    void handle(NotifyLocalChange& c);
    void handle(NotifyLocalRename& c);
    void handle(ApplyRemoteChange& c);
    void handle(Dehydrate& c);
    void handle(ResolveConflict& c);
    void handle(RefreshCredentials& c);
    void handle(SetPaused& c);
    void handle(TaskFinished& c);

    void onDownloadFinished(const InFlight& f, const concurrency::TaskResult& r);
    void onUploadFinished(const InFlight& f, const concurrency::TaskResult& r);
    void onSyncFinished(const InFlight& f, const concurrency::TaskResult& r);
    void onDeleteFinished(const InFlight& f, const concurrency::TaskResult& r);
    void onMoveFinished(const InFlight& f, const concurrency::TaskResult& r);
    void noteFailure(const concurrency::TaskResult& r);
    void advance(const fs::path& path, PlaceholderEvent event);
    static void discardStaging(const fs::path& staging);

    std::string submitTask(concurrency::TaskPayload payload, concurrency::TaskPriority priority,
                           const fs::path& path, const fs::path& dest = {});
    void submitUpload(const fs::path& path);
    void cancelUpload(const std::string& key);
    void resolveWaiters(const std::string& key, const types::OpResult& result);

    bool persist(const fs::path& path, Updater update);
    bool forget(const fs::path& path);
    bool flush(const std::string& key);
    void flushUnsaved();

    void loadState();
    void requireActive(const fs::path& path) const;
};

using MountPtr = std::shared_ptr<Mount>;

}
