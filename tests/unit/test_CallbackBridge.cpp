#include "mount_fixture.hpp"
#include "sync/CallbackBridge.hpp"

using namespace stratus;
using namespace stratus::sync;
using namespace stratus::test;
using namespace std::chrono_literals;
using types::ErrorKind;
using Status = CallbackResult::Status;

class CallbackBridgeTest : public MountFixture {
protected:
    std::unique_ptr<CallbackBridge> bridge;

    void SetUp() override {
        MountFixture::SetUp();
        bridge = std::make_unique<CallbackBridge>(mount, 5000ms);
    }
};

TEST_F(CallbackBridgeTest, OpenHydratesBeforeReturning) {
    trackRemote("a.txt", "content");
    const auto r = bridge->onOpen("a.txt");
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(readFile(root / "a.txt"), "content");

    EXPECT_TRUE(bridge->onFetchData("a.txt", 2, 3).ok());
    EXPECT_EQ(bridge->timeouts(), 0u);
}

TEST_F(CallbackBridgeTest, MissedDeadlineIsTransientAndWorkContinues) {
    trackRemote("slow.txt", "eventually");
    holdDownloads = true;

    const auto r = bridge->onOpen("slow.txt", 30ms);
    EXPECT_EQ(r.status, Status::TransientFailure);
    EXPECT_EQ(r.error, ErrorKind::Timeout);
    EXPECT_EQ(bridge->timeouts(), 1u);
    EXPECT_TRUE(waitUntil([&] { return mount->placeholderState("slow.txt") == PlaceholderState::Hydrating; }));

    holdDownloads = false;
    ASSERT_TRUE(waitUntil([&] { return mount->placeholderState("slow.txt") == PlaceholderState::Hydrated; }));
    EXPECT_TRUE(bridge->onOpen("slow.txt", 1ms).ok());
}

TEST_F(CallbackBridgeTest, PermanentFailuresAreReportedAsFailed) {
    const auto missing = bridge->onOpen("missing.txt");
    EXPECT_EQ(missing.status, Status::Failed);
    EXPECT_EQ(missing.error, ErrorKind::PathNotFound);

    ASSERT_TRUE(mount->setPaused(true).get().ok);
    const auto paused = bridge->onCreate("new.txt", false);
    EXPECT_EQ(paused.status, Status::Failed);
    EXPECT_EQ(paused.error, ErrorKind::DrivePaused);
}

TEST_F(CallbackBridgeTest, CancelledWorkIsTransient) {
    mount->stop();
    const auto r = bridge->onLocalWrite("x.txt");
    EXPECT_EQ(r.status, Status::TransientFailure);
    EXPECT_EQ(r.error, ErrorKind::Cancelled);
}

TEST_F(CallbackBridgeTest, LocalCallbacksReachTheRemote) {
    writeFile(root / "w.txt", "written");
    EXPECT_TRUE(bridge->onCreate("w.txt", false).ok());
    ASSERT_TRUE(waitUntil([&] { return backend->stat("w.txt").has_value(); }));

    std::filesystem::rename(root / "w.txt", root / "v.txt");
    ASSERT_TRUE(waitUntil([&] { return mount->placeholderState("w.txt") == PlaceholderState::Hydrated; }));
    EXPECT_TRUE(bridge->onRename("w.txt", "v.txt").ok());
    ASSERT_TRUE(waitUntil([&] { return backend->stat("v.txt").has_value(); }));

    std::filesystem::remove(root / "v.txt");
    ASSERT_TRUE(waitUntil([&] { return store->get("d1", "v.txt").has_value(); }));
    EXPECT_TRUE(bridge->onDelete("v.txt").ok());
    EXPECT_TRUE(waitUntil([&] { return !backend->stat("v.txt"); }));
}

TEST_F(CallbackBridgeTest, DehydrateCallback) {
    trackRemote("d.txt", "to be freed");
    ASSERT_TRUE(bridge->onOpen("d.txt").ok());
    EXPECT_TRUE(bridge->onDehydrate("d.txt").ok());
    EXPECT_EQ(mount->placeholderState("d.txt"), PlaceholderState::Dehydrated);
}

TEST_F(CallbackBridgeTest, RejectsBadConstruction) {
    EXPECT_THROW(CallbackBridge(mount, 0ms), std::invalid_argument);
    EXPECT_THROW(CallbackBridge(nullptr, 10ms), std::invalid_argument);
    EXPECT_EQ(to_string(Status::TransientFailure), "transient_failure");
}
