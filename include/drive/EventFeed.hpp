#pragma once

#include "types/Drive.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace stratus::drive {

struct Event {
    enum class Kind {
        DriveAdded,
        DriveRemoved,
        DriveEnabled,
        DriveDisabled,
        DriveHealthChanged,
        TaskStatusChanged,
        TaskProgress,
        ConflictDetected,
        ConflictResolved
    };

    Kind kind{Kind::TaskStatusChanged};
    types::DriveId drive_id;
    std::string task_id;
    std::string status;
    std::string message;
    nlohmann::json data = nlohmann::json::object();
};

std::string to_string(Event::Kind kind);
void to_json(nlohmann::json& j, const Event& e);

// Push-style fan-out of drive and task events. publish() is serialised, so events published
// from one thread reach every subscriber in publication order.
class EventFeed {
public:
    using Subscriber = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Subscriber fn);
    bool unsubscribe(SubscriptionId id);

    void publish(const Event& event);

    [[nodiscard]] size_t subscriberCount() const;

private:
    mutable std::mutex subscribersMutex_;
    std::mutex publishMutex_;
    std::vector<std::pair<SubscriptionId, Subscriber>> subscribers_;
    SubscriptionId nextId_ = 1;
};

using EventFeedPtr = std::shared_ptr<EventFeed>;

}
