#include <gtest/gtest.h>
#include "drive/DriveManager.hpp"
#include "concurrency/TaskManager.hpp"
#include "db/MemoryStore.hpp"
#include "sync/TaskOperations.hpp"
#include "transfer/LocalBackend.hpp"
#include "types/Error.hpp"
#include "test_helpers.hpp"

#include <ctime>
#include <mutex>
#include <optional>
#include <algorithm>
#include <nlohmann/json.hpp>

using namespace stratus;
using namespace stratus::drive;
using namespace stratus::types;
using namespace stratus::test;
using namespace std::chrono_literals;

namespace {

template <typename F>
std::optional<ErrorKind> errorKindOf(F&& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.kind();
    }
    return std::nullopt;
}

}

class DriveManagerTest : public ::testing::Test {
protected:
    TempDir state{"stratus-dm-state"};
    TempDir local{"stratus-dm-local"};
    TempDir remote{"stratus-dm-remote"};

    config::Config cfg;
    std::shared_ptr<db::MemoryStore> store = std::make_shared<db::MemoryStore>();
    std::shared_ptr<concurrency::TaskManager> tasks;
    EventFeedPtr events = std::make_shared<EventFeed>();
    std::unique_ptr<DriveManager> manager;

    std::mutex seenMutex;
    std::vector<Event> seen;

    void SetUp() override {
        cfg.remote_events.enabled = false;
        cfg.paths.drives_file = state / "drives.json";
        cfg.paths.staging_dir = state / "staging";
        cfg.transfer.chunk_size = 8;
        cfg.tasks.max_workers = 2;

        tasks = std::make_shared<concurrency::TaskManager>(cfg.tasks, sync::makeOperationTable());
        events->subscribe([this](const Event& e) {
            std::scoped_lock lock(seenMutex);
            seen.push_back(e);
        });
        manager = makeManager();
    }

    void TearDown() override {
        manager.reset();
        tasks->stopAll(500ms);
    }

    std::unique_ptr<DriveManager> makeManager() {
        return std::make_unique<DriveManager>(cfg, store, tasks, events, [](const DriveConfig& d) {
            return std::make_shared<transfer::LocalBackend>(d.backend.root);
        });
    }

    DriveConfig drive(const std::string& sub, const std::string& id = {}) const {
        DriveConfig d;
        d.id = id;
        d.sync_path = local / sub;
        d.backend.type = BackendType::Local;
        d.backend.root = remote.path();
        return d;
    }

    size_t count(const Event::Kind kind) {
        std::scoped_lock lock(seenMutex);
        return static_cast<size_t>(std::count_if(seen.begin(), seen.end(), [kind](const Event& e) { return e.kind == kind; }));
    }
};

TEST_F(DriveManagerTest, AddedDriveIsMountedAndListed) {
    const auto id = manager->addDrive(drive("docs"));
    EXPECT_FALSE(id.empty());
    EXPECT_TRUE(std::filesystem::is_directory(local / "docs"));

    const auto got = manager->getDrive(id);
    ASSERT_TRUE(got);
    EXPECT_EQ(got->name, "docs");
    EXPECT_EQ(manager->listDrives().size(), 1u);
    EXPECT_TRUE(manager->mount(id));
    EXPECT_FALSE(manager->getDrive("nope"));
    EXPECT_EQ(count(Event::Kind::DriveAdded), 1u);
}

TEST_F(DriveManagerTest, RejectsInvalidDrives) {
    DriveConfig noPath = drive("x");
    noPath.sync_path.clear();
    EXPECT_THROW(manager->addDrive(noPath), std::invalid_argument);

    DriveConfig noRoot = drive("x");
    noRoot.backend.root.clear();
    EXPECT_THROW(manager->addDrive(noRoot), std::invalid_argument);

    DriveConfig expired = drive("x");
    expired.credentials.access_token = "t";
    expired.credentials.expires_at = std::time(nullptr) - 60;
    EXPECT_EQ(errorKindOf([&] { manager->addDrive(expired); }), ErrorKind::InvalidCredential);

    DriveConfig s3 = drive("x");
    s3.backend.type = BackendType::S3;
    s3.backend.bucket = "b";
    EXPECT_EQ(errorKindOf([&] { manager->addDrive(s3); }), ErrorKind::InvalidCredential);

    s3.backend.access_key = "ak";
    s3.backend.secret_key = "sk";
    s3.backend.bucket.clear();
    EXPECT_THROW(manager->addDrive(s3), std::invalid_argument);

    EXPECT_TRUE(manager->listDrives().empty());
}

TEST_F(DriveManagerTest, OverlappingSyncRootsAreRefused) {
    manager->addDrive(drive("a", "one"));
    EXPECT_EQ(errorKindOf([&] { manager->addDrive(drive("a", "two")); }), ErrorKind::DuplicatePath);
    EXPECT_EQ(errorKindOf([&] { manager->addDrive(drive("a/inner", "three")); }), ErrorKind::DuplicatePath);
    EXPECT_EQ(errorKindOf([&] { manager->addDrive(drive("", "four")); }), ErrorKind::DuplicatePath);
    EXPECT_EQ(errorKindOf([&] { manager->addDrive(drive("b", "one")); }), ErrorKind::DuplicatePath);

    EXPECT_NO_THROW(manager->addDrive(drive("ab", "five")));
    EXPECT_EQ(manager->listDrives().size(), 2u);
}

TEST_F(DriveManagerTest, DrivesAreSavedAndReloaded) {
    auto d = drive("photos", "p1");
    d.ignore_patterns = {"*.raw"};
    manager->addDrive(d);

    auto paused = drive("music", "m1");
    paused.enabled = false;
    manager->addDrive(paused);

    const auto saved = nlohmann::json::parse(readFile(cfg.paths.drives_file));
    EXPECT_EQ(saved["drives"].size(), 2u);

    manager.reset();
    manager = makeManager();
    EXPECT_EQ(manager->load(), 2u);

    const auto reloaded = manager->getDrive("p1");
    ASSERT_TRUE(reloaded);
    EXPECT_EQ(reloaded->ignore_patterns, std::vector<std::string>{"*.raw"});
    EXPECT_TRUE(manager->mount("p1"));
    EXPECT_EQ(errorKindOf([&] { manager->mount("m1"); }), ErrorKind::DrivePaused);

    // Already registered drives are skipped.
    EXPECT_EQ(manager->load(), 0u);
}

TEST_F(DriveManagerTest, LoadWithoutFileIsEmpty) {
    EXPECT_EQ(manager->load(), 0u);
    EXPECT_TRUE(manager->listDrives().empty());
}

TEST_F(DriveManagerTest, RemoveIsIdempotentAndDropsMetadata) {
    const auto id = manager->addDrive(drive("r"));
    writeFile(remote / "f.txt", "remote");
    const auto obj = transfer::LocalBackend(remote.path()).stat("f.txt");
    ASSERT_TRUE(obj);

    FileRecord rec;
    rec.drive_id = id;
    rec.local_path = "f.txt";
    rec.remote_id = obj->remote_id;
    rec.etag = obj->etag;
    rec.size = obj->size;
    ASSERT_TRUE(manager->route(id, sync::ApplyRemoteChange{rec, false, nullptr}).get().ok);
    ASSERT_TRUE(waitUntil([&] { return !store->listByDrive(id).empty(); }));

    manager->removeDrive(id);
    EXPECT_TRUE(store->listByDrive(id).empty());
    EXPECT_FALSE(manager->getDrive(id));
    EXPECT_NO_THROW(manager->removeDrive(id));
    EXPECT_EQ(count(Event::Kind::DriveRemoved), 1u);
    EXPECT_EQ(errorKindOf([&] { manager->route(id, sync::Dehydrate{"f.txt", nullptr}); }), ErrorKind::DriveNotFound);

    const auto saved = nlohmann::json::parse(readFile(cfg.paths.drives_file));
    EXPECT_TRUE(saved["drives"].empty());
}

TEST_F(DriveManagerTest, DisablingPausesTheMount) {
    const auto id = manager->addDrive(drive("e"));
    manager->setEnabled(id, false);

    const auto m = manager->mount(id);
    ASSERT_TRUE(waitUntil([&] { return m->isPaused(); }));
    EXPECT_FALSE(manager->getDrive(id)->enabled);
    EXPECT_EQ(count(Event::Kind::DriveDisabled), 1u);

    manager->setEnabled(id, true);
    EXPECT_TRUE(waitUntil([&] { return !m->isPaused(); }));
    EXPECT_EQ(errorKindOf([&] { manager->setEnabled("ghost", true); }), ErrorKind::DriveNotFound);
}

TEST_F(DriveManagerTest, EnablingAnUnmountedDriveMountsIt) {
    auto d = drive("late", "late");
    d.enabled = false;
    manager->addDrive(d);
    EXPECT_EQ(errorKindOf([&] { manager->mount("late"); }), ErrorKind::DrivePaused);

    manager->setEnabled("late", true);
    EXPECT_TRUE(manager->mount("late"));
}

TEST_F(DriveManagerTest, BridgeServesCallbacks) {
    const auto id = manager->addDrive(drive("cb"));
    writeFile(local / "cb" / "new.txt", "hello");

    auto bridge = manager->bridge(id);
    EXPECT_TRUE(bridge.onCreate("new.txt", false).ok());
    EXPECT_TRUE(waitUntil([&] { return readFile(remote / "new.txt") == "hello"; }));
}

TEST_F(DriveManagerTest, RefreshedCredentialsArePersisted) {
    const auto id = manager->addDrive(drive("c"));

    Credentials fresh;
    fresh.access_token = "new-token";
    EXPECT_TRUE(manager->refreshCredentials(id, fresh).get().ok);
    EXPECT_EQ(manager->getDrive(id)->credentials.access_token, "new-token");

    fresh.expires_at = std::time(nullptr) - 1;
    EXPECT_EQ(errorKindOf([&] { manager->refreshCredentials(id, fresh); }), ErrorKind::InvalidCredential);
    EXPECT_EQ(errorKindOf([&] { manager->refreshCredentials("ghost", fresh); }), ErrorKind::DriveNotFound);
}

TEST_F(DriveManagerTest, StatusSummaryCoversDrivesAndTasks) {
    const auto a = manager->addDrive(drive("s1", "s1"));
    auto off = drive("s2", "s2");
    off.enabled = false;
    manager->addDrive(off);

    const auto summary = manager->statusSummary();
    ASSERT_EQ(summary.drives.size(), 2u);
    for (const auto& s : summary.drives) {
        if (s.id == a) {
            EXPECT_TRUE(s.enabled);
            EXPECT_EQ(s.health, DriveHealth::Active);
        } else {
            EXPECT_FALSE(s.enabled);
            EXPECT_EQ(s.health, DriveHealth::Paused);
        }
        EXPECT_EQ(s.conflicts, 0u);
    }
    EXPECT_EQ(summary.tasks.max_workers, 2u);

    const nlohmann::json j = summary;
    EXPECT_EQ(j["drives"].size(), 2u);
    EXPECT_TRUE(j.contains("active_tasks"));
}

TEST_F(DriveManagerTest, ShutdownUnmountsEverything) {
    const auto id = manager->addDrive(drive("x"));
    const auto m = manager->mount(id);
    manager->shutdown();
    EXPECT_EQ(errorKindOf([&] { manager->mount(id); }), ErrorKind::DrivePaused);
    EXPECT_FALSE(m->submit(sync::Dehydrate{"a", nullptr}).get().ok);
}
