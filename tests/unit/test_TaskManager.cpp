#include <gtest/gtest.h>
#include "concurrency/TaskManager.hpp"
#include "types/Error.hpp"
#include "test_helpers.hpp"

#include <array>
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>

using namespace stratus::concurrency;
using namespace stratus::types;
using namespace stratus::test;
using namespace std::chrono_literals;

namespace {

// Holds executors until opened. Executors also wake when their task is cancelled.
struct Gate {
    std::mutex mutex;
    std::condition_variable cv;
    bool open = false;

    void release() {
        {
            std::scoped_lock lock(mutex);
            open = true;
        }
        cv.notify_all();
    }

    void wait(const TaskContext& ctx) {
        std::unique_lock lock(mutex);
        while (!open) {
            if (ctx.isCancelled()) throw Error(ErrorKind::Cancelled, "gate cancelled");
            cv.wait_for(lock, 5ms);
        }
    }
};

TaskSubmission custom(const std::string& name, const DriveId& drive = "drive-a",
                      const TaskPriority priority = TaskPriority::Normal, nlohmann::json args = nlohmann::json::object()) {
    TaskSubmission s;
    s.payload = CustomPayload{name, drive, std::move(args)};
    s.priority = priority;
    return s;
}

}

class TaskManagerTest : public ::testing::Test {
protected:
    Gate gate;
    std::array<Gate, 3> gates;
    std::mutex orderMutex;
    std::vector<std::string> order;
    std::atomic<int> concurrent{0};
    std::atomic<int> peak{0};

    OperationTable table() {
        OperationTable ops;
        ops.custom["gate"] = [this](const CustomPayload&, TaskContext& ctx) {
            gate.wait(ctx);
            return nlohmann::json::object();
        };
        ops.custom["gate_n"] = [this](const CustomPayload& p, TaskContext& ctx) {
            gates.at(p.args.at("gate").get<size_t>()).wait(ctx);
            return nlohmann::json::object();
        };
        ops.custom["record"] = [this](const CustomPayload& p, TaskContext&) {
            std::scoped_lock lock(orderMutex);
            order.push_back(p.args.at("label").get<std::string>());
            return nlohmann::json{{"label", p.args.at("label")}};
        };
        ops.custom["until_cancelled"] = [](const CustomPayload&, TaskContext& ctx) -> nlohmann::json {
            while (!ctx.isCancelled()) std::this_thread::sleep_for(2ms);
            throw Error(ErrorKind::Cancelled, "stopped between chunks");
        };
        ops.custom["fail_kind"] = [](const CustomPayload&, TaskContext&) -> nlohmann::json {
            throw Error(ErrorKind::TransferFailed, "remote rejected chunk");
        };
        ops.custom["fail_plain"] = [](const CustomPayload&, TaskContext&) -> nlohmann::json {
            throw std::runtime_error("disk full");
        };
        ops.custom["progress"] = [](const CustomPayload&, TaskContext& ctx) {
            ctx.reportProgress(50, 100);
            ctx.reportProgress(20, 100);
            ctx.reportProgress(80, 100);
            return nlohmann::json::object();
        };
        ops.custom["overlap"] = [this](const CustomPayload&, TaskContext&) {
            const auto now = ++concurrent;
            int prev = peak.load();
            while (prev < now && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(30ms);
            --concurrent;
            return nlohmann::json::object();
        };
        return ops;
    }

    static stratus::config::TaskManagerConfig config(const unsigned int workers, const size_t buffer = 100) {
        stratus::config::TaskManagerConfig cfg;
        cfg.max_workers = workers;
        cfg.completed_buffer_size = buffer;
        cfg.stop_grace_period = 2000ms;
        return cfg;
    }

    static bool settled(const TaskManager& tm, const std::string& id) {
        const auto t = tm.getTask(id);
        return t && isTerminal(t->status);
    }
};

TEST_F(TaskManagerTest, RejectsZeroWorkersOrBuffer) {
    EXPECT_THROW({ TaskManager bad(config(0), table()); }, std::invalid_argument);
    EXPECT_THROW({ TaskManager bad(config(1, 0), table()); }, std::invalid_argument);

    TaskManager tm(config(1), table());
    EXPECT_THROW(tm.setMaxWorkers(0), std::invalid_argument);
    EXPECT_THROW(tm.setCompletedBufferSize(0), std::invalid_argument);
}

TEST_F(TaskManagerTest, ClaimsByPriorityThenSubmissionOrder) {
    TaskManager tm(config(1), table());

    const auto blocker = tm.submit(custom("gate"));
    ASSERT_TRUE(waitUntil([&] { return tm.getTask(blocker)->status == TaskStatus::Running; }));

    const auto a = tm.submit(custom("record", "drive-a", TaskPriority::Normal, {{"label", "A"}}));
    const auto b = tm.submit(custom("record", "drive-a", TaskPriority::High, {{"label", "B"}}));
    const auto c = tm.submit(custom("record", "drive-a", TaskPriority::Low, {{"label", "C"}}));
    const auto d = tm.submit(custom("record", "drive-a", TaskPriority::Normal, {{"label", "D"}}));

    gate.release();
    ASSERT_TRUE(waitUntil([&] { return settled(tm, a) && settled(tm, b) && settled(tm, c) && settled(tm, d); }));

    std::scoped_lock lock(orderMutex);
    EXPECT_EQ(order, (std::vector<std::string>{"B", "A", "D", "C"}));
}

TEST_F(TaskManagerTest, CriticalJumpsAheadOfEarlierWork) {
    TaskManager tm(config(1), table());

    const auto blocker = tm.submit(custom("gate"));
    ASSERT_TRUE(waitUntil([&] { return tm.getTask(blocker)->status == TaskStatus::Running; }));

    const auto a = tm.submit(custom("record", "drive-a", TaskPriority::Normal, {{"label", "A"}}));
    const auto b = tm.submit(custom("record", "drive-a", TaskPriority::Critical, {{"label", "B"}}));
    const auto c = tm.submit(custom("record", "drive-a", TaskPriority::Normal, {{"label", "C"}}));
    const auto h = tm.submit(custom("record", "drive-a", TaskPriority::High, {{"label", "H"}}));
    EXPECT_EQ(tm.getTask(h)->status, TaskStatus::Pending);

    gate.release();
    ASSERT_TRUE(waitUntil([&] { return settled(tm, a) && settled(tm, b) && settled(tm, c) && settled(tm, h); }));

    std::scoped_lock lock(orderMutex);
    EXPECT_EQ(order, (std::vector<std::string>{"B", "H", "A", "C"}));
}

TEST_F(TaskManagerTest, CancelPendingNeverRuns) {
    TaskManager tm(config(1), table());

    const auto blocker = tm.submit(custom("gate"));
    ASSERT_TRUE(waitUntil([&] { return tm.getTask(blocker)->status == TaskStatus::Running; }));

    std::promise<TaskResult> done;
    auto sub = custom("record", "drive-a", TaskPriority::Normal, {{"label", "never"}});
    sub.on_complete = [&done](const TaskResult& r) { done.set_value(r); };
    const auto id = tm.submit(std::move(sub));

    EXPECT_TRUE(tm.cancel(id));
    EXPECT_FALSE(tm.cancel(id));

    const auto r = done.get_future().get();
    EXPECT_EQ(r.status, TaskStatus::Cancelled);
    EXPECT_EQ(r.error_kind, ErrorKind::Cancelled);

    gate.release();
    ASSERT_TRUE(waitUntil([&] { return settled(tm, blocker); }));
    std::this_thread::sleep_for(20ms);

    std::scoped_lock lock(orderMutex);
    EXPECT_TRUE(order.empty());
    EXPECT_EQ(tm.getTask(id)->status, TaskStatus::Cancelled);
}

TEST_F(TaskManagerTest, CancelRunningIsCooperative) {
    TaskManager tm(config(2), table());

    const auto id = tm.submit(custom("until_cancelled"));
    ASSERT_TRUE(waitUntil([&] { return tm.getTask(id)->status == TaskStatus::Running; }));

    EXPECT_TRUE(tm.cancel(id));
    ASSERT_TRUE(waitUntil([&] { return settled(tm, id); }));

    const auto t = tm.getTask(id);
    EXPECT_EQ(t->status, TaskStatus::Cancelled);
    EXPECT_EQ(t->error_kind, ErrorKind::Cancelled);
    EXPECT_FALSE(tm.cancel(id));
}

TEST_F(TaskManagerTest, CancelUnknownTaskReturnsFalse) {
    TaskManager tm(config(1), table());
    EXPECT_FALSE(tm.cancel("no-such-task"));
}

TEST_F(TaskManagerTest, FailuresCarryTheirKind) {
    TaskManager tm(config(2), table());

    const auto kinded = tm.submit(custom("fail_kind"));
    const auto plain = tm.submit(custom("fail_plain"));
    const auto missing = tm.submit(custom("not_registered"));
    ASSERT_TRUE(waitUntil([&] { return settled(tm, kinded) && settled(tm, plain) && settled(tm, missing); }));

    const auto k = tm.getTask(kinded);
    EXPECT_EQ(k->status, TaskStatus::Failed);
    EXPECT_EQ(k->error_kind, ErrorKind::TransferFailed);
    EXPECT_EQ(k->error, "remote rejected chunk");

    const auto p = tm.getTask(plain);
    EXPECT_EQ(p->status, TaskStatus::Failed);
    EXPECT_FALSE(p->error_kind.has_value());
    EXPECT_EQ(p->error, "disk full");

    EXPECT_EQ(tm.getTask(missing)->status, TaskStatus::Failed);

    const auto stats = tm.statistics();
    EXPECT_EQ(stats.failed, 3u);
    EXPECT_EQ(stats.pending + stats.running, 0u);
}

TEST_F(TaskManagerTest, ProgressNeverMovesBackwards) {
    TaskManager tm(config(1), table());

    std::mutex m;
    std::vector<double> seen;
    tm.setEventSink([&](const TaskEvent& e) {
        if (e.kind != TaskEvent::Kind::Progress) return;
        std::scoped_lock lock(m);
        seen.push_back(e.task.progress);
    });

    const auto id = tm.submit(custom("progress"));
    ASSERT_TRUE(waitUntil([&] { return settled(tm, id); }));

    std::scoped_lock lock(m);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_DOUBLE_EQ(seen[0], 0.5);
    EXPECT_DOUBLE_EQ(seen[1], 0.5);
    EXPECT_DOUBLE_EQ(seen[2], 0.8);

    const auto t = tm.getTask(id);
    EXPECT_EQ(t->status, TaskStatus::Completed);
    EXPECT_DOUBLE_EQ(t->progress, 1.0);
    EXPECT_EQ(t->processed_bytes, 100u);
}

TEST_F(TaskManagerTest, StatusEventsArriveInLifecycleOrder) {
    TaskManager tm(config(1), table());

    std::mutex m;
    std::vector<TaskStatus> statuses;
    tm.setEventSink([&](const TaskEvent& e) {
        if (e.kind != TaskEvent::Kind::StatusChanged) return;
        std::scoped_lock lock(m);
        statuses.push_back(e.task.status);
    });

    const auto id = tm.submit(custom("record", "drive-a", TaskPriority::Normal, {{"label", "x"}}));
    ASSERT_TRUE(waitUntil([&] { return settled(tm, id); }));
    ASSERT_TRUE(waitUntil([&] {
        std::scoped_lock lock(m);
        return statuses.size() == 3;
    }));

    std::scoped_lock lock(m);
    EXPECT_EQ(statuses, (std::vector<TaskStatus>{TaskStatus::Pending, TaskStatus::Running, TaskStatus::Completed}));
    EXPECT_EQ(tm.getTask(id)->result.at("label"), "x");
}

TEST_F(TaskManagerTest, CompletedBufferEvictsOldestFirst) {
    TaskManager tm(config(1, 2), table());

    std::vector<std::string> ids;
    for (const auto* label : {"one", "two", "three"}) {
        ids.push_back(tm.submit(custom("record", "drive-a", TaskPriority::Normal, {{"label", label}})));
        ASSERT_TRUE(waitUntil([&] { return settled(tm, ids.back()); }));
    }

    EXPECT_FALSE(tm.getTask(ids[0]).has_value());
    EXPECT_TRUE(tm.getTask(ids[1]).has_value());
    EXPECT_TRUE(tm.getTask(ids[2]).has_value());
    EXPECT_EQ(tm.listTasks().size(), 2u);

    tm.setCompletedBufferSize(1);
    EXPECT_FALSE(tm.getTask(ids[1]).has_value());
    EXPECT_EQ(tm.statistics().completed_buffer_size, 1u);

    tm.clearCompleted();
    EXPECT_TRUE(tm.listTasks().empty());
}

TEST_F(TaskManagerTest, ShrinkingLimitsFutureClaims) {
    TaskManager tm(config(4), table());
    tm.setMaxWorkers(1);
    EXPECT_EQ(tm.statistics().max_workers, 1u);

    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i) ids.push_back(tm.submit(custom("overlap")));
    ASSERT_TRUE(waitUntil([&] {
        for (const auto& id : ids)
            if (!settled(tm, id)) return false;
        return true;
    }));

    EXPECT_EQ(peak.load(), 1);
}

TEST_F(TaskManagerTest, ShrinkingNeverPreemptsRunningTasks) {
    TaskManager tm(config(4), table());

    std::vector<std::string> held;
    for (size_t i = 0; i < 3; ++i) held.push_back(tm.submit(custom("gate_n", "drive-a", TaskPriority::Normal, {{"gate", i}})));
    ASSERT_TRUE(waitUntil([&] { return tm.statistics().running == 3; }));

    tm.setMaxWorkers(1);
    const auto fourth = tm.submit(custom("record", "drive-a", TaskPriority::Normal, {{"label", "late"}}));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(tm.statistics().running, 3u);
    EXPECT_EQ(tm.getTask(fourth)->status, TaskStatus::Pending);

    gates[0].release();
    gates[1].release();
    ASSERT_TRUE(waitUntil([&] { return settled(tm, held[0]) && settled(tm, held[1]); }));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(tm.statistics().running, 1u);
    EXPECT_EQ(tm.getTask(fourth)->status, TaskStatus::Pending);

    gates[2].release();
    ASSERT_TRUE(waitUntil([&] { return settled(tm, fourth); }));
    EXPECT_EQ(tm.getTask(fourth)->status, TaskStatus::Completed);
    EXPECT_EQ(tm.statistics().max_workers, 1u);
}

TEST_F(TaskManagerTest, GrowingAddsWorkers) {
    TaskManager tm(config(1), table());
    tm.setMaxWorkers(3);

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) ids.push_back(tm.submit(custom("gate")));

    EXPECT_TRUE(waitUntil([&] { return tm.statistics().running == 3; }));
    gate.release();
    ASSERT_TRUE(waitUntil([&] { return tm.statistics().completed == 3; }));
}

TEST_F(TaskManagerTest, FiltersByDriveTypeAndStatus) {
    TaskManager tm(config(1), table());

    const auto blocker = tm.submit(custom("gate", "drive-b"));
    ASSERT_TRUE(waitUntil([&] { return tm.getTask(blocker)->status == TaskStatus::Running; }));
    tm.submit(custom("record", "drive-a", TaskPriority::Normal, {{"label", "1"}}));
    tm.submit(custom("record", "drive-a", TaskPriority::Normal, {{"label", "2"}}));

    EXPECT_EQ(tm.listTasks({.drive_id = "drive-a"}).size(), 2u);
    EXPECT_EQ(tm.listTasks({.status = TaskStatus::Running}).size(), 1u);
    EXPECT_EQ(tm.listTasks({.type = TaskType::Custom}).size(), 3u);
    EXPECT_TRUE(tm.listTasks({.type = TaskType::Upload}).empty());

    const auto all = tm.listTasks();
    for (size_t i = 1; i < all.size(); ++i) EXPECT_LE(all[i - 1].created_at, all[i].created_at);

    EXPECT_EQ(tm.cancelDrive("drive-a"), 2u);
    EXPECT_EQ(tm.listTasks({.drive_id = "drive-a", .status = TaskStatus::Cancelled}).size(), 2u);
    gate.release();
}

TEST_F(TaskManagerTest, StopAllCancelsEverythingAndRejectsNewWork) {
    TaskManager tm(config(1), table());

    const auto running = tm.submit(custom("until_cancelled"));
    ASSERT_TRUE(waitUntil([&] { return tm.getTask(running)->status == TaskStatus::Running; }));
    const auto pending = tm.submit(custom("record", "drive-a", TaskPriority::Normal, {{"label", "late"}}));

    tm.stopAll(2000ms);
    EXPECT_TRUE(tm.isStopped());

    const auto p = tm.getTask(pending);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->status, TaskStatus::Cancelled);
    EXPECT_EQ(p->error, "Task manager stopped");
    EXPECT_EQ(tm.getTask(running)->status, TaskStatus::Cancelled);

    EXPECT_THROW(tm.submit(custom("record", "drive-a", TaskPriority::Normal, {{"label", "x"}})), std::runtime_error);

    std::scoped_lock lock(orderMutex);
    EXPECT_TRUE(order.empty());
}
