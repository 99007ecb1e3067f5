#pragma once

#include "concurrency/OperationTable.hpp"
#include "concurrency/Task.hpp"
#include "config/Config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

namespace stratus::concurrency {

// Priority-ordered, cancellable task execution on a bounded worker pool.
//
// Claims are ordered by (priority desc, submission sequence asc). Shrinking the worker limit never
// preempts a running task; it only bounds future claims. Terminal records are kept in a FIFO
// buffer of fixed capacity.
class TaskManager {
public:
    TaskManager(const config::TaskManagerConfig& cfg, OperationTable ops);
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    std::string submit(TaskSubmission submission);

    // Pending tasks are cancelled without running; running tasks are signalled.
    // Returns false for unknown or already terminal tasks.
    bool cancel(const std::string& taskId);

    size_t cancelDrive(const types::DriveId& driveId);

    // Cancels everything, waits up to the grace period for running tasks, then abandons stragglers.
    void stopAll(std::chrono::milliseconds grace);
    void stopAll() { stopAll(gracePeriod_); }

    [[nodiscard]] std::optional<TaskRecord> getTask(const std::string& taskId) const;
    [[nodiscard]] std::vector<TaskRecord> listTasks(const TaskFilter& filter = {}) const;
    [[nodiscard]] TaskStatistics statistics() const;

    void clearCompleted();
    void setMaxWorkers(unsigned int n);
    void setCompletedBufferSize(size_t n);
    void setEventSink(EventSink sink);

    [[nodiscard]] bool isStopped() const;

private:
    struct TaskState {
        TaskRecord record;
        TaskPayload payload;
        CancellationTokenPtr token;
        CompletionCallback onComplete;
    };
    using TaskStatePtr = std::shared_ptr<TaskState>;

    struct QueueEntry {
        TaskPriority priority;
        uint64_t seq;
        TaskStatePtr state;
    };

    struct QueueEntryCompare {
        bool operator()(const QueueEntry& a, const QueueEntry& b) const;
    };

    // Everything workers touch lives here so an abandoned worker never outlives its state.
    struct Shared {
        mutable std::mutex mutex;
        std::condition_variable workCv;
        std::condition_variable idleCv;

        std::priority_queue<QueueEntry, std::vector<QueueEntry>, QueueEntryCompare> heap;
        std::unordered_map<std::string, TaskStatePtr> active;
        std::deque<TaskStatePtr> completed;

        unsigned int maxWorkers = 1;
        size_t completedCapacity = 100;
        unsigned int running = 0;
        uint64_t nextSeq = 0;
        bool stopping = false;

        OperationTable ops;

        std::mutex sinkMutex;
        EventSink sink;

        void emit(TaskEvent::Kind kind, const TaskRecord& record);
        void retire(const TaskStatePtr& state);   // caller holds mutex
        void finish(const TaskStatePtr& state, TaskStatus status, nlohmann::json result,
                    std::optional<types::ErrorKind> kind, std::string error);
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> exited;
    };

    std::shared_ptr<Shared> shared_;
    std::vector<Worker> workers_;
    std::mutex workersMutex_;
    std::chrono::milliseconds gracePeriod_;

    void spawnWorker();
    static void workerLoop(const std::shared_ptr<Shared>& s);
    static void execute(const std::shared_ptr<Shared>& s, const TaskStatePtr& state);
};

}
