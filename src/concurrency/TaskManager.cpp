#include "concurrency/TaskManager.hpp"
#include "crypto/util/uuid.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <ranges>

using namespace stratus::concurrency;
using namespace stratus::types;
using namespace stratus::util;

bool TaskManager::QueueEntryCompare::operator()(const QueueEntry& a, const QueueEntry& b) const {
    if (a.priority != b.priority) return a.priority < b.priority;  // max-heap on priority
    return a.seq > b.seq;                                          // then FIFO
}

namespace {

std::pair<std::filesystem::path, std::filesystem::path> pathsOf(const TaskPayload& payload) {
    return std::visit([]<typename T>(const T& p) -> std::pair<std::filesystem::path, std::filesystem::path> {
        if constexpr (std::is_same_v<T, UploadPayload>) return {p.local_path, p.remote_path};
        else if constexpr (std::is_same_v<T, DownloadPayload>) return {p.remote_path, p.local_path};
        else if constexpr (std::is_same_v<T, SyncPayload>) return {p.remote_path, p.local_path};
        else if constexpr (std::is_same_v<T, DeletePayload>) return {{}, p.local_path};
        else if constexpr (std::is_same_v<T, CopyPayload> || std::is_same_v<T, MovePayload>) return {p.from, p.to};
        else return {{}, p.args.value("path", std::string{})};
    }, payload);
}

}

TaskManager::TaskManager(const config::TaskManagerConfig& cfg, OperationTable ops)
    : shared_(std::make_shared<Shared>()), gracePeriod_(cfg.stop_grace_period) {
    if (cfg.max_workers == 0) throw std::invalid_argument("max_workers must be greater than zero");
    if (cfg.completed_buffer_size == 0) throw std::invalid_argument("completed_buffer_size must be greater than zero");

    shared_->maxWorkers = cfg.max_workers;
    shared_->completedCapacity = cfg.completed_buffer_size;
    shared_->ops = std::move(ops);

    for (unsigned int i = 0; i < cfg.max_workers; ++i) spawnWorker();

    stratus::log::Registry::tasks()->info("[TaskManager] Started with {} workers, completed buffer {}",
                                 cfg.max_workers, cfg.completed_buffer_size);
}

TaskManager::~TaskManager() {
    if (!isStopped()) stopAll();
}

void TaskManager::spawnWorker() {
    auto exited = std::make_shared<std::atomic<bool>>(false);
    auto s = shared_;
    std::scoped_lock lock(workersMutex_);
    workers_.push_back({std::thread([s, exited] {
        workerLoop(s);
        exited->store(true, std::memory_order_release);
    }), exited});
}

void TaskManager::workerLoop(const std::shared_ptr<Shared>& s) {
    while (true) {
        TaskStatePtr state;
        {
            std::unique_lock lock(s->mutex);
            s->workCv.wait(lock, [&] { return s->stopping || (!s->heap.empty() && s->running < s->maxWorkers); });
            if (s->stopping) return;

            auto entry = s->heap.top();
            s->heap.pop();

            // Cancelled while pending; its record already moved to the completed buffer.
            if (entry.state->record.status != TaskStatus::Pending) continue;

            state = std::move(entry.state);
            state->record.status = TaskStatus::Running;
            state->record.updated_at = Clock::now();
            ++s->running;
        }

        TaskRecord snapshot;
        {
            std::scoped_lock lock(s->mutex);
            snapshot = state->record;
        }
        s->emit(TaskEvent::Kind::StatusChanged, snapshot);

        execute(s, state);
    }
}

void TaskManager::execute(const std::shared_ptr<Shared>& s, const TaskStatePtr& state) {
    const auto id = state->record.id;

    TaskContext ctx(id, state->token, [s, state](const uintmax_t processed, const uintmax_t total) {
        TaskRecord snapshot;
        {
            std::scoped_lock lock(s->mutex);
            auto& r = state->record;
            if (r.status != TaskStatus::Running) return;
            r.total_bytes = total;
            r.processed_bytes = std::max(r.processed_bytes, std::min(processed, total));
            if (total > 0) r.progress = std::max(r.progress, static_cast<double>(r.processed_bytes) / static_cast<double>(total));
            r.updated_at = Clock::now();
            snapshot = r;
        }
        s->emit(TaskEvent::Kind::Progress, snapshot);
    });

    try {
        auto result = s->ops.dispatch(state->payload, ctx);
        s->finish(state, TaskStatus::Completed, std::move(result), std::nullopt, {});
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Cancelled) {
            stratus::log::Registry::tasks()->info("[TaskManager] Task {} cancelled: {}", id, e.what());
            s->finish(state, TaskStatus::Cancelled, nlohmann::json::object(), ErrorKind::Cancelled, e.what());
        } else {
            stratus::log::Registry::tasks()->warn("[TaskManager] Task {} failed ({}): {}", id, to_string(e.kind()), e.what());
            s->finish(state, TaskStatus::Failed, nlohmann::json::object(), e.kind(), e.what());
        }
    } catch (const std::exception& e) {
        stratus::log::Registry::tasks()->error("[TaskManager] Task {} failed: {}", id, e.what());
        s->finish(state, TaskStatus::Failed, nlohmann::json::object(), std::nullopt, e.what());
    }
}

void TaskManager::Shared::emit(const TaskEvent::Kind kind, const TaskRecord& record) {
    std::scoped_lock lock(sinkMutex);
    if (!sink) return;
    try {
        sink({kind, record});
    } catch (const std::exception& e) {
        stratus::log::Registry::tasks()->error("[TaskManager] Event sink failed for task {}: {}", record.id, e.what());
    }
}

void TaskManager::Shared::retire(const TaskStatePtr& state) {
    active.erase(state->record.id);
    completed.push_back(state);
    while (completed.size() > completedCapacity) completed.pop_front();
}

void TaskManager::Shared::finish(const TaskStatePtr& state, const TaskStatus status, nlohmann::json result,
                                 std::optional<ErrorKind> kind, std::string error) {
    TaskRecord snapshot;
    {
        std::scoped_lock lock(mutex);
        auto& r = state->record;
        r.status = status;
        r.updated_at = Clock::now();
        r.result = std::move(result);
        if (status == TaskStatus::Completed) {
            r.progress = 1.0;
            r.processed_bytes = std::max(r.processed_bytes, r.total_bytes);
        } else {
            r.error = error;
            r.error_kind = kind;
        }
        snapshot = r;

        --running;
        retire(state);
    }
    workCv.notify_all();
    idleCv.notify_all();

    emit(TaskEvent::Kind::StatusChanged, snapshot);

    if (state->onComplete) {
        try {
            state->onComplete({snapshot.id, status, kind, std::move(error), snapshot.result});
        } catch (const std::exception& e) {
            stratus::log::Registry::tasks()->error("[TaskManager] Completion callback for task {} failed: {}", snapshot.id, e.what());
        }
    }
}

std::string TaskManager::submit(TaskSubmission submission) {
    auto state = std::make_shared<TaskState>();
    auto& r = state->record;
    r.id = stratus::crypto::util::uuid4_hex();
    r.drive_id = driveIdOf(submission.payload);
    r.type = typeOf(submission.payload);
    r.priority = submission.priority;
    std::tie(r.source_path, r.target_path) = pathsOf(submission.payload);
    r.metadata = std::move(submission.metadata);
    r.created_at = r.updated_at = Clock::now();

    state->payload = std::move(submission.payload);
    state->token = std::make_shared<CancellationToken>();
    state->onComplete = std::move(submission.on_complete);

    {
        std::scoped_lock lock(shared_->mutex);
        if (shared_->stopping) throw std::runtime_error("TaskManager is stopped");
    }

    // Published before the task becomes claimable so Submitted precedes Started.
    shared_->emit(TaskEvent::Kind::StatusChanged, r);

    {
        std::scoped_lock lock(shared_->mutex);
        if (shared_->stopping) throw std::runtime_error("TaskManager is stopped");
        shared_->active.emplace(r.id, state);
        shared_->heap.push({r.priority, shared_->nextSeq++, state});
    }
    shared_->workCv.notify_one();

    stratus::log::Registry::tasks()->debug("[TaskManager] Submitted {} task {} ({}) for drive {}",
                                  to_string(r.type), r.id, to_string(r.priority), r.drive_id);
    return r.id;
}

bool TaskManager::cancel(const std::string& taskId) {
    TaskStatePtr cancelledPending;
    {
        std::scoped_lock lock(shared_->mutex);
        const auto it = shared_->active.find(taskId);
        if (it == shared_->active.end()) return false;

        const auto state = it->second;
        if (state->record.status == TaskStatus::Running) {
            state->token->cancel();
            stratus::log::Registry::tasks()->debug("[TaskManager] Signalled cancellation to running task {}", taskId);
            return true;
        }

        state->token->cancel();
        state->record.status = TaskStatus::Cancelled;
        state->record.error_kind = ErrorKind::Cancelled;
        state->record.error = "Cancelled before start";
        state->record.updated_at = Clock::now();
        shared_->retire(state);
        cancelledPending = state;
    }

    shared_->emit(TaskEvent::Kind::StatusChanged, cancelledPending->record);
    if (cancelledPending->onComplete) {
        try {
            cancelledPending->onComplete({taskId, TaskStatus::Cancelled, ErrorKind::Cancelled, "Cancelled before start", {}});
        } catch (const std::exception& e) {
            stratus::log::Registry::tasks()->error("[TaskManager] Completion callback for task {} failed: {}", taskId, e.what());
        }
    }
    return true;
}

size_t TaskManager::cancelDrive(const DriveId& driveId) {
    std::vector<std::string> ids;
    {
        std::scoped_lock lock(shared_->mutex);
        for (const auto& [id, state] : shared_->active)
            if (state->record.drive_id == driveId) ids.push_back(id);
    }

    size_t n = 0;
    for (const auto& id : ids)
        if (cancel(id)) ++n;

    if (n > 0) stratus::log::Registry::tasks()->info("[TaskManager] Cancelled {} tasks for drive {}", n, driveId);
    return n;
}

void TaskManager::stopAll(const std::chrono::milliseconds grace) {
    std::vector<TaskStatePtr> pending;
    {
        std::scoped_lock lock(shared_->mutex);
        if (shared_->stopping) return;
        shared_->stopping = true;

        for (const auto& state : shared_->active | std::views::values) {
            state->token->cancel();
            if (state->record.status == TaskStatus::Pending) pending.push_back(state);
        }

        for (const auto& state : pending) {
            state->record.status = TaskStatus::Cancelled;
            state->record.error_kind = ErrorKind::Cancelled;
            state->record.error = "Task manager stopped";
            state->record.updated_at = Clock::now();
            shared_->retire(state);
        }

        while (!shared_->heap.empty()) shared_->heap.pop();
    }
    shared_->workCv.notify_all();

    for (const auto& state : pending) {
        shared_->emit(TaskEvent::Kind::StatusChanged, state->record);
        if (state->onComplete) {
            try {
                state->onComplete({state->record.id, TaskStatus::Cancelled, ErrorKind::Cancelled, "Task manager stopped", {}});
            } catch (const std::exception& e) {
                stratus::log::Registry::tasks()->error("[TaskManager] Completion callback for task {} failed: {}", state->record.id, e.what());
            }
        }
    }

    bool drained;
    {
        std::unique_lock lock(shared_->mutex);
        drained = shared_->idleCv.wait_for(lock, grace, [&] { return shared_->running == 0; });
    }

    // A worker reporting idle may still be between finish() and exiting its loop.
    std::scoped_lock lock(workersMutex_);
    size_t abandoned = 0;
    for (auto& w : workers_) {
        if (!w.thread.joinable()) continue;
        if (drained || w.exited->load(std::memory_order_acquire)) w.thread.join();
        else {
            w.thread.detach();
            ++abandoned;
        }
    }
    workers_.clear();

    if (abandoned > 0)
        stratus::log::Registry::tasks()->warn("[TaskManager] Grace period of {} ms elapsed, abandoned {} workers",
                                     grace.count(), abandoned);
    stratus::log::Registry::tasks()->info("[TaskManager] Stopped");
}

std::optional<TaskRecord> TaskManager::getTask(const std::string& taskId) const {
    std::scoped_lock lock(shared_->mutex);
    if (const auto it = shared_->active.find(taskId); it != shared_->active.end()) return it->second->record;
    for (const auto& state : shared_->completed)
        if (state->record.id == taskId) return state->record;
    return std::nullopt;
}

std::vector<TaskRecord> TaskManager::listTasks(const TaskFilter& filter) const {
    std::vector<TaskRecord> out;
    std::scoped_lock lock(shared_->mutex);
    for (const auto& state : shared_->active | std::views::values)
        if (filter.matches(state->record)) out.push_back(state->record);
    for (const auto& state : shared_->completed)
        if (filter.matches(state->record)) out.push_back(state->record);
    std::ranges::stable_sort(out, {}, &TaskRecord::created_at);
    return out;
}

TaskStatistics TaskManager::statistics() const {
    TaskStatistics stats;
    std::scoped_lock lock(shared_->mutex);
    for (const auto& state : shared_->active | std::views::values) {
        if (state->record.status == TaskStatus::Running) ++stats.running;
        else ++stats.pending;
    }
    for (const auto& state : shared_->completed) {
        switch (state->record.status) {
            case TaskStatus::Completed: ++stats.completed; break;
            case TaskStatus::Failed: ++stats.failed; break;
            case TaskStatus::Cancelled: ++stats.cancelled; break;
            default: break;
        }
    }
    stats.max_workers = shared_->maxWorkers;
    stats.completed_buffer_size = shared_->completedCapacity;
    return stats;
}

void TaskManager::clearCompleted() {
    std::scoped_lock lock(shared_->mutex);
    shared_->completed.clear();
}

void TaskManager::setMaxWorkers(const unsigned int n) {
    if (n == 0) throw std::invalid_argument("max_workers must be greater than zero");

    size_t threads;
    {
        std::scoped_lock lock(shared_->mutex);
        if (shared_->stopping) throw std::runtime_error("TaskManager is stopped");
        shared_->maxWorkers = n;
    }
    {
        std::scoped_lock lock(workersMutex_);
        threads = workers_.size();
    }
    for (size_t i = threads; i < n; ++i) spawnWorker();
    shared_->workCv.notify_all();

    stratus::log::Registry::tasks()->info("[TaskManager] Worker limit set to {}", n);
}

void TaskManager::setCompletedBufferSize(const size_t n) {
    if (n == 0) throw std::invalid_argument("completed_buffer_size must be greater than zero");
    std::scoped_lock lock(shared_->mutex);
    shared_->completedCapacity = n;
    while (shared_->completed.size() > n) shared_->completed.pop_front();
}

void TaskManager::setEventSink(EventSink sink) {
    std::scoped_lock lock(shared_->sinkMutex);
    shared_->sink = std::move(sink);
}

bool TaskManager::isStopped() const {
    std::scoped_lock lock(shared_->mutex);
    return shared_->stopping;
}
