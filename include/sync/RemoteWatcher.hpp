#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "sync/RemoteFeed.hpp"
#include "transfer/RetryPolicy.hpp"
#include "types/Drive.hpp"

#include <atomic>
#include <functional>

namespace stratus::sync {

// Polls a RemoteFeed and hands each change to the sink. Consecutive poll failures back off
// exponentially; once the retry budget is spent the push-lost handler fires and the watcher keeps
// polling at the maximum backoff until the feed answers again.
class RemoteWatcher final : public concurrency::AsyncService {
public:
    using ChangeSink = std::function<void(const RemoteChange&)>;
    using PushLostHandler = std::function<void(bool lost)>;

    RemoteWatcher(types::DriveId driveId, RemoteFeedPtr feed, const config::RemoteEventsConfig& cfg,
                  ChangeSink sink, PushLostHandler onPushLost);

    ~RemoteWatcher() override;

    // One poll; returns the number of changes delivered. Throws when the feed fails.
    size_t pollOnce();

    [[nodiscard]] bool pushLost() const { return pushLost_.load(); }
    [[nodiscard]] unsigned int consecutiveFailures() const { return failures_.load(); }

protected:
    void runLoop() override;

private:
    types::DriveId driveId_;
    RemoteFeedPtr feed_;
    std::chrono::milliseconds pollInterval_;
    transfer::RetryPolicy retry_;
    ChangeSink sink_;
    PushLostHandler onPushLost_;
    std::atomic<bool> pushLost_{false};
    std::atomic<unsigned int> failures_{0};

    void setPushLost(bool lost);
};

}
