#include <gtest/gtest.h>
#include "drive/EventFeed.hpp"

#include <atomic>
#include <thread>

using namespace stratus::drive;

namespace {

Event event(const Event::Kind kind, const std::string& task = {}) {
    Event e;
    e.kind = kind;
    e.drive_id = "d1";
    e.task_id = task;
    return e;
}

}

TEST(EventFeedTest, EverySubscriberSeesEveryEvent) {
    EventFeed feed;
    std::vector<std::string> a, b;
    feed.subscribe([&](const Event& e) { a.push_back(e.task_id); });
    const auto idB = feed.subscribe([&](const Event& e) { b.push_back(e.task_id); });
    EXPECT_EQ(feed.subscriberCount(), 2u);

    feed.publish(event(Event::Kind::TaskStatusChanged, "t1"));
    EXPECT_TRUE(feed.unsubscribe(idB));
    EXPECT_FALSE(feed.unsubscribe(idB));
    feed.publish(event(Event::Kind::TaskStatusChanged, "t2"));

    EXPECT_EQ(a, (std::vector<std::string>{"t1", "t2"}));
    EXPECT_EQ(b, std::vector<std::string>{"t1"});
}

TEST(EventFeedTest, FailingSubscriberDoesNotStarveOthers) {
    EventFeed feed;
    int delivered = 0;
    feed.subscribe([](const Event&) { throw std::runtime_error("subscriber bug"); });
    feed.subscribe([&](const Event&) { ++delivered; });

    EXPECT_NO_THROW(feed.publish(event(Event::Kind::DriveAdded)));
    EXPECT_EQ(delivered, 1);
}

TEST(EventFeedTest, ConcurrentPublishersAreSerialised) {
    EventFeed feed;
    std::atomic<int> inside{0};
    std::atomic<int> overlap{0};
    std::atomic<int> total{0};
    feed.subscribe([&](const Event&) {
        if (inside.fetch_add(1) != 0) overlap.fetch_add(1);
        std::this_thread::yield();
        inside.fetch_sub(1);
        total.fetch_add(1);
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) feed.publish(event(Event::Kind::TaskProgress));
        });
    for (auto& t : threads) t.join();

    EXPECT_EQ(total.load(), 800);
    EXPECT_EQ(overlap.load(), 0);
}

TEST(EventFeedTest, EventsSerialiseWithKindNames) {
    auto e = event(Event::Kind::ConflictDetected, "t9");
    e.message = "docs/a.txt";
    e.data["path"] = "docs/a.txt";

    const nlohmann::json j = e;
    EXPECT_EQ(j.at("kind"), "conflict_detected");
    EXPECT_EQ(j.at("drive_id"), "d1");
    EXPECT_EQ(j.at("data").at("path"), "docs/a.txt");
    EXPECT_EQ(to_string(Event::Kind::DriveHealthChanged), "drive_health_changed");
}
