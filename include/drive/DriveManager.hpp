#pragma once

#include "concurrency/TaskManager.hpp"
#include "config/Config.hpp"
#include "crypto/IdGenerator.hpp"
#include "db/MetadataStore.hpp"
#include "drive/EventFeed.hpp"
#include "sync/CallbackBridge.hpp"
#include "sync/Mount.hpp"
#include "sync/RemoteWatcher.hpp"
#include "transfer/BackendFactory.hpp"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace stratus::drive {

struct DriveStatus {
    types::DriveId id;
    std::string name;
    bool enabled = true;
    types::DriveHealth health{types::DriveHealth::Active};
    size_t conflicts = 0;
    size_t inflight = 0;
    std::string mount_error;
};

struct StatusSummary {
    std::vector<DriveStatus> drives;
    size_t active_tasks = 0;
    size_t finished_tasks = 0;
    concurrency::TaskStatistics tasks;
};

void to_json(nlohmann::json& j, const DriveStatus& s);
void to_json(nlohmann::json& j, const StatusSummary& s);

// The registry of drives and their mounts. Drive configurations are persisted to the drives file
// on every change.
class DriveManager {
public:
    DriveManager(const config::Config& cfg, db::MetadataStorePtr store, std::shared_ptr<concurrency::TaskManager> tasks,
                 EventFeedPtr events = std::make_shared<EventFeed>(), transfer::BackendFactory factory = {});

    ~DriveManager();

    DriveManager(const DriveManager&) = delete;
    DriveManager& operator=(const DriveManager&) = delete;

    // Throws Error(DuplicatePath) when the sync root overlaps another drive's, and
    // Error(InvalidCredential) for expired or missing credentials.
    types::DriveId addDrive(types::DriveConfig cfg);

    // Idempotent.
    void removeDrive(const types::DriveId& id);

    void setEnabled(const types::DriveId& id, bool enabled);

    // Throws Error(DriveNotFound), or Error(DrivePaused) when the drive has no running mount.
    std::future<types::OpResult> route(const types::DriveId& id, sync::MountCommand cmd);

    std::future<types::OpResult> refreshCredentials(const types::DriveId& id, types::Credentials credentials);

    [[nodiscard]] sync::MountPtr mount(const types::DriveId& id) const;
    [[nodiscard]] sync::CallbackBridge bridge(const types::DriveId& id) const;

    [[nodiscard]] std::optional<types::DriveConfig> getDrive(const types::DriveId& id) const;
    [[nodiscard]] std::vector<types::DriveConfig> listDrives() const;
    [[nodiscard]] StatusSummary statusSummary() const;

    // Reads the drives file and mounts the enabled drives. Returns the number of drives loaded.
    size_t load();

    void shutdown();

    [[nodiscard]] const EventFeedPtr& events() const { return events_; }

private:
    struct Entry {
        types::DriveConfig config;
        sync::MountPtr mount;
        std::unique_ptr<sync::RemoteWatcher> watcher;
        std::string mount_error;
    };

    struct Mounted {
        sync::MountPtr mount;
        std::unique_ptr<sync::RemoteWatcher> watcher;
    };

    config::Config cfg_;
    db::MetadataStorePtr store_;
    std::shared_ptr<concurrency::TaskManager> tasks_;
    EventFeedPtr events_;
    transfer::BackendFactory factory_;
    crypto::IdGenerator ids_;

    mutable std::mutex mutex_;
    std::map<types::DriveId, Entry> drives_;

    void validate(const types::DriveConfig& cfg, const types::DriveId& self) const;
    Mounted mountDrive(const types::DriveConfig& cfg) const;
    void attach(const types::DriveId& id, Mounted mounted);
    static void teardown(Entry& entry);
    void save() const;
    void publish(Event::Kind kind, const types::DriveId& id, const std::string& message = {}) const;
};

}
