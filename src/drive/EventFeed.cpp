#include "drive/EventFeed.hpp"
#include "log/Registry.hpp"

#include <ranges>

using namespace stratus::drive;

namespace stratus::drive {

std::string to_string(const Event::Kind kind) {
    switch (kind) {
        case Event::Kind::DriveAdded: return "drive_added";
        case Event::Kind::DriveRemoved: return "drive_removed";
        case Event::Kind::DriveEnabled: return "drive_enabled";
        case Event::Kind::DriveDisabled: return "drive_disabled";
        case Event::Kind::DriveHealthChanged: return "drive_health_changed";
        case Event::Kind::TaskStatusChanged: return "task_status_changed";
        case Event::Kind::TaskProgress: return "task_progress";
        case Event::Kind::ConflictDetected: return "conflict_detected";
        case Event::Kind::ConflictResolved: return "conflict_resolved";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const Event& e) {
    j = {
        {"kind", to_string(e.kind)},
        {"drive_id", e.drive_id},
        {"task_id", e.task_id},
        {"status", e.status},
        {"message", e.message},
        {"data", e.data}
    };
}

}

EventFeed::SubscriptionId EventFeed::subscribe(Subscriber fn) {
    std::scoped_lock lock(subscribersMutex_);
    const auto id = nextId_++;
    subscribers_.emplace_back(id, std::move(fn));
    return id;
}

bool EventFeed::unsubscribe(const SubscriptionId id) {
    std::scoped_lock lock(subscribersMutex_);
    return std::erase_if(subscribers_, [id](const auto& s) { return s.first == id; }) > 0;
}

void EventFeed::publish(const Event& event) {
    std::scoped_lock publishLock(publishMutex_);

    std::vector<Subscriber> targets;
    {
        std::scoped_lock lock(subscribersMutex_);
        targets.reserve(subscribers_.size());
        for (const auto& fn : subscribers_ | std::views::values) targets.push_back(fn);
    }

    for (const auto& fn : targets) {
        try {
            fn(event);
        } catch (const std::exception& e) {
            log::Registry::drive()->error("[EventFeed] Subscriber failed on {}: {}", to_string(event.kind), e.what());
        }
    }
}

size_t EventFeed::subscriberCount() const {
    std::scoped_lock lock(subscribersMutex_);
    return subscribers_.size();
}
