#pragma once

#include "concurrency/TaskManager.hpp"
#include "db/MemoryStore.hpp"
#include "drive/EventFeed.hpp"
#include "sync/Mount.hpp"
#include "sync/PlaceholderHost.hpp"
#include "sync/TaskOperations.hpp"
#include "transfer/LocalBackend.hpp"
#include "types/Error.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <thread>

namespace stratus::test {

// A mount over a LocalBackend "remote" directory. Uploads can be held back to keep a path
// DirtyLocal for as long as a test needs; a held upload gives up when its task is cancelled.
// uploadPasses lets that many held uploads through. holdDownloadResults parks a download after
// its last chunk, where cancellation is no longer observed.
class MountFixture : public ::testing::Test {
protected:
    TempDir root{"stratus-mount-root"};
    TempDir remote{"stratus-mount-remote"};
    TempDir staging{"stratus-mount-staging"};

    std::shared_ptr<transfer::LocalBackend> backend = std::make_shared<transfer::LocalBackend>(remote.path());
    std::shared_ptr<db::MemoryStore> store = std::make_shared<db::MemoryStore>();
    std::shared_ptr<drive::EventFeed> events = std::make_shared<drive::EventFeed>();
    std::shared_ptr<concurrency::TaskManager> tasks;
    sync::DriveContextPtr ctx;
    sync::MountPtr mount;

    std::atomic<bool> holdUploads{false};
    std::atomic<bool> holdDownloads{false};
    std::atomic<int> uploadPasses{0};
    std::atomic<bool> holdDownloadResults{false};

    std::mutex eventsMutex;
    std::vector<drive::Event> seen;

    void SetUp() override {
        auto ops = sync::makeOperationTable();
        ops.upload = [this](const concurrency::UploadPayload& p, concurrency::TaskContext& c) {
            holdWhile(holdUploads, c, &uploadPasses);
            return sync::ops::upload(p, c);
        };
        ops.download = [this](const concurrency::DownloadPayload& p, concurrency::TaskContext& c) {
            holdWhile(holdDownloads, c);
            auto result = sync::ops::download(p, c);
            while (holdDownloadResults.load()) std::this_thread::sleep_for(std::chrono::milliseconds(2));
            return result;
        };

        config::TaskManagerConfig tcfg;
        tcfg.max_workers = 2;
        tcfg.stop_grace_period = std::chrono::milliseconds(500);
        tasks = std::make_shared<concurrency::TaskManager>(tcfg, std::move(ops));

        ctx = std::make_shared<sync::DriveContext>();
        ctx->drive_id = "d1";
        ctx->sync_root = root.path();
        ctx->backend = backend;
        ctx->store = store;
        ctx->host = std::make_shared<sync::LocalPlaceholderHost>(root.path());
        ctx->transfer.chunk_size = 4;
        ctx->transfer.max_retries = 1;
        ctx->transfer.retry_base_delay = std::chrono::milliseconds(1);
        ctx->staging_dir = staging.path();

        events->subscribe([this](const drive::Event& e) {
            std::scoped_lock lock(eventsMutex);
            seen.push_back(e);
        });

        mount = std::make_shared<sync::Mount>(ctx, tasks, events);
        mount->start();
    }

    void TearDown() override {
        holdUploads = false;
        holdDownloads = false;
        holdDownloadResults = false;
        if (mount) mount->stop();
        tasks->stopAll(std::chrono::milliseconds(500));
    }

    static void holdWhile(const std::atomic<bool>& flag, const concurrency::TaskContext& c,
                          std::atomic<int>* passes = nullptr) {
        while (flag.load()) {
            if (passes) {
                int n = passes->load();
                if (n > 0 && passes->compare_exchange_strong(n, n - 1)) return;
            }
            if (c.isCancelled()) throw types::Error(types::ErrorKind::Cancelled, "held task cancelled");
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    }

    static types::OpResult await(std::future<types::OpResult> f) {
        if (f.wait_for(std::chrono::seconds(10)) != std::future_status::ready)
            return types::OpResult::failure(types::ErrorKind::Timeout, "test wait expired");
        return f.get();
    }

    // Places an object on the remote side and returns the record a change feed would report.
    types::FileRecord putRemote(const std::string& rel, const std::string& content) {
        writeFile(remote / rel, content);
        const auto obj = backend->stat(rel);
        types::FileRecord r;
        r.drive_id = "d1";
        r.local_path = rel;
        r.remote_id = obj->remote_id;
        r.etag = obj->etag;
        r.size = obj->size;
        return r;
    }

    // Remote object announced, placeholder created and recorded.
    void trackRemote(const std::string& rel, const std::string& content) {
        ASSERT_TRUE(await(mount->applyRemoteChange(putRemote(rel, content))).ok);
        ASSERT_TRUE(waitUntil([&] { return store->get("d1", rel).has_value(); }));
    }

    bool stateIs(const std::string& rel, const sync::PlaceholderState s) const {
        return mount->placeholderState(rel) == s;
    }

    size_t eventCount(const drive::Event::Kind kind) {
        std::scoped_lock lock(eventsMutex);
        return static_cast<size_t>(std::count_if(seen.begin(), seen.end(), [kind](const auto& e) { return e.kind == kind; }));
    }
};

}
