#include <gtest/gtest.h>
#include "sync/RemoteWatcher.hpp"
#include "transfer/LocalBackend.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>

using namespace stratus;
using namespace stratus::sync;
using namespace stratus::test;
using namespace std::chrono_literals;

namespace {

// Feed whose availability the test flips at will.
class SwitchableFeed final : public RemoteFeed {
public:
    std::atomic<bool> down{false};
    std::atomic<int> polls{0};

    std::vector<RemoteChange> poll() override {
        ++polls;
        if (down) throw std::runtime_error("event endpoint unreachable");
        return {{"/a.txt", "a.txt", "e1", 1, false}};
    }
};

config::RemoteEventsConfig fastConfig() {
    config::RemoteEventsConfig cfg;
    cfg.max_retries = 2;
    cfg.initial_backoff = 1ms;
    cfg.max_backoff = 5ms;
    cfg.poll_interval = 5ms;
    return cfg;
}

std::vector<std::string> paths(const std::vector<RemoteChange>& changes) {
    std::vector<std::string> out;
    for (const auto& c : changes) out.push_back((c.deleted ? "-" : "+") + c.path.generic_string());
    std::sort(out.begin(), out.end());
    return out;
}

}

TEST(PollingRemoteFeedTest, ReportsDifferencesBetweenListings) {
    TempDir dir("stratus-feed");
    const auto backend = std::make_shared<transfer::LocalBackend>(dir.path());
    PollingRemoteFeed feed(backend);

    writeFile(dir / "a.txt", "a");
    writeFile(dir / "sub/b.txt", "b");
    EXPECT_EQ(paths(feed.poll()), (std::vector<std::string>{"+/a.txt", "+/sub/b.txt"}));
    EXPECT_TRUE(feed.poll().empty());

    writeFile(dir / "a.txt", "changed");
    std::filesystem::remove(dir / "sub/b.txt");
    writeFile(dir / "c.txt", "c");
    EXPECT_EQ(paths(feed.poll()), (std::vector<std::string>{"+/a.txt", "+/c.txt", "-/sub/b.txt"}));
}

TEST(RemoteWatcherTest, PollOnceDeliversToSink) {
    const auto feed = std::make_shared<SwitchableFeed>();
    std::vector<RemoteChange> seen;
    RemoteWatcher watcher("d1", feed, fastConfig(), [&](const RemoteChange& c) { seen.push_back(c); }, nullptr);

    EXPECT_EQ(watcher.pollOnce(), 1u);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].etag, "e1");

    feed->down = true;
    EXPECT_THROW(watcher.pollOnce(), std::runtime_error);
}

TEST(RemoteWatcherTest, PushLostAfterRetriesAndRecovered) {
    const auto feed = std::make_shared<SwitchableFeed>();
    feed->down = true;

    std::mutex m;
    std::vector<bool> transitions;
    RemoteWatcher watcher("d1", feed, fastConfig(), [](const RemoteChange&) {},
                          [&](const bool lost) {
                              std::scoped_lock lock(m);
                              transitions.push_back(lost);
                          });

    watcher.start();
    ASSERT_TRUE(waitUntil([&] { return watcher.pushLost(); }));
    EXPECT_GE(watcher.consecutiveFailures(), 2u);

    feed->down = false;
    ASSERT_TRUE(waitUntil([&] { return !watcher.pushLost(); }));
    EXPECT_EQ(watcher.consecutiveFailures(), 0u);
    watcher.stop();

    std::scoped_lock lock(m);
    EXPECT_EQ(transitions, (std::vector<bool>{true, false}));
}

TEST(RemoteWatcherTest, RequiresAFeed) {
    EXPECT_THROW(RemoteWatcher("d1", nullptr, fastConfig(), [](const RemoteChange&) {}, nullptr), std::invalid_argument);
}
