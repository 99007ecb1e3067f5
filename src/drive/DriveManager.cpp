#include "drive/DriveManager.hpp"
#include "crypto/ChunkCipher.hpp"
#include "log/Registry.hpp"
#include "sync/RemoteFeed.hpp"

#include <fstream>
#include <fmt/format.h>
#include <ranges>

using namespace stratus::drive;
using namespace stratus::types;
using namespace stratus::concurrency;

namespace {

namespace fs = std::filesystem;

bool nested(const fs::path& parent, const fs::path& child) {
    auto p = parent.begin();
    auto c = child.begin();
    for (; p != parent.end(); ++p, ++c) {
        if (p->empty()) continue;   // trailing separator
        if (c == child.end() || *p != *c) return false;
    }
    return true;
}

fs::path normalizedRoot(const fs::path& p) {
    return fs::weakly_canonical(fs::absolute(p)).lexically_normal();
}

}

namespace stratus::drive {

void to_json(nlohmann::json& j, const DriveStatus& s) {
    j = {
        {"id", s.id},
        {"name", s.name},
        {"enabled", s.enabled},
        {"health", to_string(s.health)},
        {"conflicts", s.conflicts},
        {"inflight", s.inflight}
    };
    if (!s.mount_error.empty()) j["mount_error"] = s.mount_error;
}

void to_json(nlohmann::json& j, const StatusSummary& s) {
    j = {
        {"drives", s.drives},
        {"active_tasks", s.active_tasks},
        {"finished_tasks", s.finished_tasks},
        {"tasks", s.tasks}
    };
}

}

DriveManager::DriveManager(const config::Config& cfg, db::MetadataStorePtr store, std::shared_ptr<TaskManager> tasks,
                           EventFeedPtr events, transfer::BackendFactory factory)
    : cfg_(cfg),
      store_(std::move(store)),
      tasks_(std::move(tasks)),
      events_(events ? std::move(events) : std::make_shared<EventFeed>()),
      factory_(std::move(factory)),
      ids_(crypto::IdOptions{.namespace_token = "drive"}) {
    if (!store_) throw std::invalid_argument("DriveManager requires a metadata store");
    if (!tasks_) throw std::invalid_argument("DriveManager requires a task manager");

    if (!factory_) {
        const auto transferCfg = cfg_.transfer;
        factory_ = [transferCfg](const DriveConfig& d) { return transfer::makeBackend(d, transferCfg); };
    }

    tasks_->setEventSink([feed = events_](const TaskEvent& e) {
        const auto kind = e.kind == TaskEvent::Kind::Progress ? Event::Kind::TaskProgress : Event::Kind::TaskStatusChanged;
        feed->publish({kind, e.task.drive_id, e.task.id, to_string(e.task.status), e.task.error.value_or(""), e.task});
    });
}

DriveManager::~DriveManager() {
    shutdown();
    tasks_->setEventSink({});
}

void DriveManager::validate(const DriveConfig& cfg, const DriveId& self) const {
    if (cfg.sync_path.empty()) throw std::invalid_argument("Drive sync_path must not be empty");

    const auto root = normalizedRoot(cfg.sync_path);
    for (const auto& [id, entry] : drives_) {
        if (id == self) continue;
        const auto other = normalizedRoot(entry.config.sync_path);
        if (nested(other, root) || nested(root, other))
            throw Error(ErrorKind::DuplicatePath,
                        fmt::format("Sync root {} overlaps drive {} ({})", root.string(), id, other.string()));
    }

    if (cfg.credentials.isExpired())
        throw Error(ErrorKind::InvalidCredential, "Credentials for drive " + cfg.name + " are expired");

    const auto& b = cfg.backend;
    switch (b.type) {
        case BackendType::S3:
            if (b.access_key.empty() || b.secret_key.empty())
                throw Error(ErrorKind::InvalidCredential, "S3 drive " + cfg.name + " needs an access key and secret key");
            if (b.bucket.empty()) throw std::invalid_argument("S3 drive " + cfg.name + " needs a bucket");
            break;
        case BackendType::Local:
            if (b.root.empty()) throw std::invalid_argument("Local drive " + cfg.name + " needs a backend root");
            break;
    }
}

DriveId DriveManager::addDrive(DriveConfig cfg) {
    DriveId id;
    {
        std::scoped_lock lock(mutex_);
        if (cfg.id.empty()) cfg.id = ids_.generate();
        if (drives_.contains(cfg.id)) throw Error(ErrorKind::DuplicatePath, "Drive id already registered: " + cfg.id);
        validate(cfg, cfg.id);
        if (cfg.name.empty()) cfg.name = cfg.sync_path.filename().string();

        fs::create_directories(cfg.sync_path);
        id = cfg.id;
        drives_.emplace(id, Entry{cfg, nullptr, nullptr, {}});
        save();
    }

    log::Registry::drive()->info("[DriveManager] Added drive {} ({}) at {}", id, cfg.name, cfg.sync_path.string());
    publish(Event::Kind::DriveAdded, id, cfg.name);

    if (!cfg.enabled) return id;

    try {
        attach(id, mountDrive(cfg));
    } catch (const std::exception& e) {
        log::Registry::drive()->error("[DriveManager] Failed to mount new drive {}: {}", id, e.what());
        {
            std::scoped_lock lock(mutex_);
            drives_.erase(id);
            save();
        }
        publish(Event::Kind::DriveRemoved, id, e.what());
        throw;
    }
    return id;
}

DriveManager::Mounted DriveManager::mountDrive(const DriveConfig& cfg) const {
    auto ctx = std::make_shared<sync::DriveContext>();
    ctx->drive_id = cfg.id;
    ctx->sync_root = cfg.sync_path;
    ctx->backend = factory_(cfg);
    ctx->store = store_;
    ctx->host = std::make_shared<sync::LocalPlaceholderHost>(cfg.sync_path);
    ctx->transfer = cfg_.transfer;
    if (!cfg.encryption_key_path.empty()) ctx->encryption_key = crypto::ChunkCipher::loadKey(cfg.encryption_key_path);
    ctx->staging_dir = cfg_.paths.staging_dir / cfg.id;

    auto patterns = cfg_.ignore.patterns;
    patterns.insert(patterns.end(), cfg.ignore_patterns.begin(), cfg.ignore_patterns.end());

    Mounted m;
    m.mount = std::make_shared<sync::Mount>(ctx, tasks_, events_, sync::IgnoreMatcher(patterns));
    m.mount->start();

    if (cfg_.remote_events.enabled) {
        std::weak_ptr<sync::Mount> weak = m.mount;
        m.watcher = std::make_unique<sync::RemoteWatcher>(
            cfg.id, std::make_shared<sync::PollingRemoteFeed>(ctx->backend), cfg_.remote_events,
            [weak, driveId = cfg.id](const sync::RemoteChange& c) {
                const auto mount = weak.lock();
                if (!mount) return;
                FileRecord rec;
                rec.drive_id = driveId;
                rec.local_path = c.path.relative_path();
                rec.remote_id = c.remote_id;
                rec.etag = c.etag;
                rec.size = c.size;
                mount->post(sync::ApplyRemoteChange{std::move(rec), c.deleted, nullptr});
            },
            [weak](const bool lost) {
                if (const auto mount = weak.lock()) mount->setEventPushLost(lost);
            });
        m.watcher->start();
    }

    return m;
}

void DriveManager::attach(const DriveId& id, Mounted mounted) {
    Entry stale;
    {
        std::scoped_lock lock(mutex_);
        const auto it = drives_.find(id);
        if (it != drives_.end()) {
            it->second.mount = std::move(mounted.mount);
            it->second.watcher = std::move(mounted.watcher);
            it->second.mount_error.clear();
            return;
        }
        stale.mount = std::move(mounted.mount);
        stale.watcher = std::move(mounted.watcher);
    }
    // Removed while mounting.
    teardown(stale);
}

void DriveManager::teardown(Entry& entry) {
    if (entry.watcher) entry.watcher->stop();
    if (entry.mount) entry.mount->stop();
    entry.watcher.reset();
    entry.mount.reset();
}

void DriveManager::removeDrive(const DriveId& id) {
    Entry removed;
    {
        std::scoped_lock lock(mutex_);
        const auto it = drives_.find(id);
        if (it == drives_.end()) {
            log::Registry::drive()->debug("[DriveManager] Drive {} already removed", id);
            return;
        }
        removed = std::move(it->second);
        drives_.erase(it);
    }

    teardown(removed);
    const auto cancelled = tasks_->cancelDrive(id);

    try {
        store_->removeByDrive(id);
    } catch (const Error& e) {
        log::Registry::drive()->error("[DriveManager] Could not delete metadata of drive {}: {}", id, e.what());
        std::scoped_lock lock(mutex_);
        drives_.emplace(id, std::move(removed));
        throw;
    }

    std::error_code ec;
    fs::remove_all(cfg_.paths.staging_dir / id, ec);

    {
        std::scoped_lock lock(mutex_);
        save();
    }

    log::Registry::drive()->info("[DriveManager] Removed drive {} ({} tasks cancelled)", id, cancelled);
    publish(Event::Kind::DriveRemoved, id, removed.config.name);
}

void DriveManager::setEnabled(const DriveId& id, const bool enabled) {
    sync::MountPtr mount;
    DriveConfig cfg;
    {
        std::scoped_lock lock(mutex_);
        const auto it = drives_.find(id);
        if (it == drives_.end()) throw Error(ErrorKind::DriveNotFound, "Unknown drive: " + id);
        it->second.config.enabled = enabled;
        mount = it->second.mount;
        cfg = it->second.config;
        save();
    }

    if (mount) mount->post(sync::SetPaused{!enabled, nullptr});
    else if (enabled) attach(id, mountDrive(cfg));

    log::Registry::drive()->info("[DriveManager] Drive {} {}", id, enabled ? "enabled" : "disabled");
    publish(enabled ? Event::Kind::DriveEnabled : Event::Kind::DriveDisabled, id);
}

std::future<OpResult> DriveManager::route(const DriveId& id, sync::MountCommand cmd) {
    return mount(id)->submit(std::move(cmd));
}

std::future<OpResult> DriveManager::refreshCredentials(const DriveId& id, Credentials credentials) {
    sync::MountPtr m;
    {
        std::scoped_lock lock(mutex_);
        const auto it = drives_.find(id);
        if (it == drives_.end()) throw Error(ErrorKind::DriveNotFound, "Unknown drive: " + id);
        if (credentials.isExpired())
            throw Error(ErrorKind::InvalidCredential, "Refreshed credentials for drive " + id + " are already expired");
        it->second.config.credentials = credentials;
        m = it->second.mount;
        save();
    }

    if (m) return m->refreshCredentials(std::move(credentials));

    std::promise<OpResult> done;
    done.set_value(OpResult::success());
    return done.get_future();
}

sync::MountPtr DriveManager::mount(const DriveId& id) const {
    std::scoped_lock lock(mutex_);
    const auto it = drives_.find(id);
    if (it == drives_.end()) throw Error(ErrorKind::DriveNotFound, "Unknown drive: " + id);
    if (!it->second.mount) throw Error(ErrorKind::DrivePaused, "Drive " + id + " is not mounted");
    return it->second.mount;
}

stratus::sync::CallbackBridge DriveManager::bridge(const DriveId& id) const {
    return {mount(id), cfg_.bridge.callback_deadline};
}

std::optional<DriveConfig> DriveManager::getDrive(const DriveId& id) const {
    std::scoped_lock lock(mutex_);
    const auto it = drives_.find(id);
    if (it == drives_.end()) return std::nullopt;
    return it->second.config;
}

std::vector<DriveConfig> DriveManager::listDrives() const {
    std::vector<DriveConfig> out;
    std::scoped_lock lock(mutex_);
    out.reserve(drives_.size());
    for (const auto& entry : drives_ | std::views::values) out.push_back(entry.config);
    return out;
}

StatusSummary DriveManager::statusSummary() const {
    StatusSummary summary;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [id, entry] : drives_) {
            DriveStatus s;
            s.id = id;
            s.name = entry.config.name;
            s.enabled = entry.config.enabled;
            s.mount_error = entry.mount_error;
            if (entry.mount) {
                s.health = entry.mount->health();
                s.conflicts = entry.mount->conflicts().size();
                s.inflight = entry.mount->inflightCount();
            } else {
                s.health = entry.mount_error.empty() ? DriveHealth::Paused : DriveHealth::Error;
            }
            summary.drives.push_back(std::move(s));
        }
    }

    summary.tasks = tasks_->statistics();
    summary.active_tasks = summary.tasks.pending + summary.tasks.running;
    summary.finished_tasks = summary.tasks.completed + summary.tasks.failed + summary.tasks.cancelled;
    return summary;
}

size_t DriveManager::load() {
    const auto& file = cfg_.paths.drives_file;
    if (!fs::exists(file)) {
        log::Registry::drive()->info("[DriveManager] No drives file at {}", file.string());
        return 0;
    }

    std::ifstream in(file);
    if (!in) throw std::runtime_error("Failed to open drives file: " + file.string());
    const auto j = nlohmann::json::parse(in);

    std::vector<DriveConfig> toMount;
    size_t loaded = 0;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& dj : j.value("drives", nlohmann::json::array())) {
            auto cfg = dj.get<DriveConfig>();
            if (drives_.contains(cfg.id)) continue;
            drives_.emplace(cfg.id, Entry{cfg, nullptr, nullptr, {}});
            if (cfg.enabled) toMount.push_back(std::move(cfg));
            ++loaded;
        }
    }

    for (const auto& cfg : toMount) {
        try {
            attach(cfg.id, mountDrive(cfg));
        } catch (const std::exception& e) {
            log::Registry::drive()->error("[DriveManager] Failed to mount drive {}: {}", cfg.id, e.what());
            std::scoped_lock lock(mutex_);
            if (const auto it = drives_.find(cfg.id); it != drives_.end()) it->second.mount_error = e.what();
        }
    }

    log::Registry::drive()->info("[DriveManager] Loaded {} drives ({} mounted) from {}", loaded, toMount.size(), file.string());
    return loaded;
}

void DriveManager::shutdown() {
    std::vector<Entry> entries;
    {
        std::scoped_lock lock(mutex_);
        for (auto& entry : drives_ | std::views::values) {
            if (!entry.mount && !entry.watcher) continue;
            Entry e;
            e.mount = std::move(entry.mount);
            e.watcher = std::move(entry.watcher);
            entries.push_back(std::move(e));
        }
    }

    for (auto& e : entries) teardown(e);
    if (!entries.empty()) log::Registry::drive()->info("[DriveManager] Unmounted {} drives", entries.size());
}

void DriveManager::save() const {
    const auto& file = cfg_.paths.drives_file;
    if (file.has_parent_path()) fs::create_directories(file.parent_path());

    nlohmann::json j;
    j["drives"] = nlohmann::json::array();
    for (const auto& entry : drives_ | std::views::values) j["drives"].push_back(entry.config);

    const auto tmp = fs::path(file.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to write drives file: " + tmp.string());
        out << j.dump(2);
        if (!out) throw std::runtime_error("Failed to write drives file: " + tmp.string());
    }
    fs::rename(tmp, file);
}

void DriveManager::publish(const Event::Kind kind, const DriveId& id, const std::string& message) const {
    events_->publish({kind, id, {}, {}, message, {}});
}
