#include "sync/RemoteWatcher.hpp"
#include "log/Registry.hpp"

using namespace stratus::sync;

RemoteWatcher::RemoteWatcher(types::DriveId driveId, RemoteFeedPtr feed, const config::RemoteEventsConfig& cfg,
                             ChangeSink sink, PushLostHandler onPushLost)
    : AsyncService("RemoteWatcher:" + driveId),
      driveId_(std::move(driveId)),
      feed_(std::move(feed)),
      pollInterval_(cfg.poll_interval),
      retry_(transfer::RetryPolicy::from(cfg)),
      sink_(std::move(sink)),
      onPushLost_(std::move(onPushLost)) {
    if (!feed_) throw std::invalid_argument("RemoteWatcher requires a feed");
}

RemoteWatcher::~RemoteWatcher() { stop(); }

size_t RemoteWatcher::pollOnce() {
    const auto changes = feed_->poll();
    for (const auto& c : changes) sink_(c);
    return changes.size();
}

void RemoteWatcher::setPushLost(const bool lost) {
    if (pushLost_.exchange(lost) == lost) return;
    if (onPushLost_) onPushLost_(lost);
}

void RemoteWatcher::runLoop() {
    while (!interruptFlag_.load(std::memory_order_acquire)) {
        auto wait = pollInterval_;

        try {
            const auto n = pollOnce();
            if (n > 0) log::Registry::mount()->debug("[RemoteWatcher] {} remote changes for drive {}", n, driveId_);
            failures_ = 0;
            setPushLost(false);
        } catch (const std::exception& e) {
            const auto attempt = failures_++;
            if (retry_.shouldRetry(attempt + 1)) {
                wait = retry_.delay(attempt);
                log::Registry::mount()->warn("[RemoteWatcher] Poll for drive {} failed (attempt {}), retrying in {} ms: {}",
                                             driveId_, attempt + 1, wait.count(), e.what());
            } else {
                wait = retry_.max_delay;
                if (!pushLost_) log::Registry::mount()->error("[RemoteWatcher] Remote events for drive {} lost after {} attempts: {}",
                                                              driveId_, attempt + 1, e.what());
                setPushLost(true);
            }
        }

        waitForInterrupt(wait);
    }
}
