#pragma once

#include "concurrency/CancellationToken.hpp"
#include "types/Drive.hpp"
#include "types/Error.hpp"
#include "util/timestamp.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace stratus::sync { struct DriveContext; }

namespace stratus::concurrency {

namespace fs = std::filesystem;

using DriveContextPtr = std::shared_ptr<sync::DriveContext>;

enum class TaskType { Upload, Download, Sync, Delete, Copy, Move, Custom };
enum class TaskPriority { Low, Normal, High, Critical };
enum class TaskStatus { Pending, Running, Completed, Failed, Cancelled };

std::string to_string(TaskType type);
std::string to_string(TaskPriority priority);
std::string to_string(TaskStatus status);
TaskType taskTypeFromString(const std::string& str);
TaskPriority taskPriorityFromString(const std::string& str);
TaskStatus taskStatusFromString(const std::string& str);

inline bool isTerminal(const TaskStatus s) {
    return s == TaskStatus::Completed || s == TaskStatus::Failed || s == TaskStatus::Cancelled;
}

struct UploadPayload {
    DriveContextPtr drive;
    fs::path local_path;
    fs::path remote_path;
};

struct DownloadPayload {
    DriveContextPtr drive;
    fs::path remote_path;
    fs::path local_path;
};

// Reconciles one path's metadata with the remote side without moving content.
struct SyncPayload {
    DriveContextPtr drive;
    fs::path local_path;
    fs::path remote_path;
};

struct DeletePayload {
    DriveContextPtr drive;
    fs::path local_path;
    fs::path remote_path;
    bool delete_remote = true;
    bool delete_local = false;
};

struct CopyPayload {
    DriveContextPtr drive;
    fs::path from;
    fs::path to;
};

struct MovePayload {
    DriveContextPtr drive;
    fs::path from;
    fs::path to;
};

struct CustomPayload {
    std::string name;
    types::DriveId drive_id;
    nlohmann::json args = nlohmann::json::object();
};

using TaskPayload = std::variant<UploadPayload, DownloadPayload, SyncPayload, DeletePayload,
                                 CopyPayload, MovePayload, CustomPayload>;

TaskType typeOf(const TaskPayload& payload);
types::DriveId driveIdOf(const TaskPayload& payload);

struct TaskRecord {
    std::string id;
    types::DriveId drive_id;
    TaskType type{TaskType::Custom};
    TaskPriority priority{TaskPriority::Normal};
    fs::path source_path;
    fs::path target_path;
    TaskStatus status{TaskStatus::Pending};
    double progress = 0.0;
    uintmax_t total_bytes = 0;
    uintmax_t processed_bytes = 0;
    nlohmann::json metadata = nlohmann::json::object();
    util::Timestamp created_at{};
    util::Timestamp updated_at{};
    std::optional<std::string> error;
    std::optional<types::ErrorKind> error_kind;
    nlohmann::json result = nlohmann::json::object();
};

struct TaskResult {
    std::string task_id;
    TaskStatus status{TaskStatus::Completed};
    std::optional<types::ErrorKind> error_kind;
    std::string error;
    nlohmann::json result = nlohmann::json::object();

    [[nodiscard]] bool ok() const { return status == TaskStatus::Completed; }
};

using CompletionCallback = std::function<void(const TaskResult&)>;

struct TaskSubmission {
    TaskPayload payload;
    TaskPriority priority{TaskPriority::Normal};
    nlohmann::json metadata = nlohmann::json::object();
    CompletionCallback on_complete;
};

struct TaskFilter {
    std::optional<TaskType> type;
    std::optional<fs::path> target_path;
    std::optional<types::DriveId> drive_id;
    std::optional<TaskStatus> status;

    [[nodiscard]] bool matches(const TaskRecord& r) const;
};

struct TaskStatistics {
    size_t pending = 0;
    size_t running = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    unsigned int max_workers = 0;
    size_t completed_buffer_size = 0;
};

struct TaskEvent {
    enum class Kind { StatusChanged, Progress };

    Kind kind{Kind::StatusChanged};
    TaskRecord task;
};

using EventSink = std::function<void(const TaskEvent&)>;

// Handed to the executing operation: cancellation and progress reporting for one task.
class TaskContext {
public:
    using ProgressReporter = std::function<void(uintmax_t processed, uintmax_t total)>;

    TaskContext(std::string taskId, CancellationTokenPtr token, ProgressReporter reporter)
        : taskId_(std::move(taskId)), token_(std::move(token)), reporter_(std::move(reporter)) {}

    [[nodiscard]] const std::string& taskId() const { return taskId_; }
    [[nodiscard]] const CancellationTokenPtr& token() const { return token_; }
    [[nodiscard]] bool isCancelled() const { return token_->isCancelled(); }

    void reportProgress(const uintmax_t processed, const uintmax_t total) const {
        if (reporter_) reporter_(processed, total);
    }

private:
    std::string taskId_;
    CancellationTokenPtr token_;
    ProgressReporter reporter_;
};

void to_json(nlohmann::json& j, const TaskRecord& r);
void to_json(nlohmann::json& j, const TaskStatistics& s);

}
