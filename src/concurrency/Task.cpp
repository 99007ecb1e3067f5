#include "concurrency/Task.hpp"
#include "sync/DriveContext.hpp"

#include <stdexcept>

namespace stratus::concurrency {

std::string to_string(const TaskType type) {
    switch (type) {
        case TaskType::Upload: return "upload";
        case TaskType::Download: return "download";
        case TaskType::Sync: return "sync";
        case TaskType::Delete: return "delete";
        case TaskType::Copy: return "copy";
        case TaskType::Move: return "move";
        case TaskType::Custom: return "custom";
    }
    return "unknown";
}

std::string to_string(const TaskPriority priority) {
    switch (priority) {
        case TaskPriority::Low: return "low";
        case TaskPriority::Normal: return "normal";
        case TaskPriority::High: return "high";
        case TaskPriority::Critical: return "critical";
    }
    return "unknown";
}

std::string to_string(const TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

TaskType taskTypeFromString(const std::string& str) {
    if (str == "upload") return TaskType::Upload;
    if (str == "download") return TaskType::Download;
    if (str == "sync") return TaskType::Sync;
    if (str == "delete") return TaskType::Delete;
    if (str == "copy") return TaskType::Copy;
    if (str == "move") return TaskType::Move;
    if (str == "custom") return TaskType::Custom;
    throw std::invalid_argument("Unknown task type: " + str);
}

TaskPriority taskPriorityFromString(const std::string& str) {
    if (str == "low") return TaskPriority::Low;
    if (str == "normal") return TaskPriority::Normal;
    if (str == "high") return TaskPriority::High;
    if (str == "critical") return TaskPriority::Critical;
    throw std::invalid_argument("Unknown task priority: " + str);
}

TaskStatus taskStatusFromString(const std::string& str) {
    if (str == "pending") return TaskStatus::Pending;
    if (str == "running") return TaskStatus::Running;
    if (str == "completed") return TaskStatus::Completed;
    if (str == "failed") return TaskStatus::Failed;
    if (str == "cancelled") return TaskStatus::Cancelled;
    throw std::invalid_argument("Unknown task status: " + str);
}

TaskType typeOf(const TaskPayload& payload) {
    return std::visit([]<typename T>(const T&) {
        if constexpr (std::is_same_v<T, UploadPayload>) return TaskType::Upload;
        else if constexpr (std::is_same_v<T, DownloadPayload>) return TaskType::Download;
        else if constexpr (std::is_same_v<T, SyncPayload>) return TaskType::Sync;
        else if constexpr (std::is_same_v<T, DeletePayload>) return TaskType::Delete;
        else if constexpr (std::is_same_v<T, CopyPayload>) return TaskType::Copy;
        else if constexpr (std::is_same_v<T, MovePayload>) return TaskType::Move;
        else return TaskType::Custom;
    }, payload);
}

types::DriveId driveIdOf(const TaskPayload& payload) {
    return std::visit([]<typename T>(const T& p) -> types::DriveId {
        if constexpr (std::is_same_v<T, CustomPayload>) return p.drive_id;
        else return p.drive ? p.drive->drive_id : types::DriveId{};
    }, payload);
}

bool TaskFilter::matches(const TaskRecord& r) const {
    if (type && r.type != *type) return false;
    if (target_path && r.target_path != *target_path) return false;
    if (drive_id && r.drive_id != *drive_id) return false;
    if (status && r.status != *status) return false;
    return true;
}

void to_json(nlohmann::json& j, const TaskRecord& r) {
    j = {
        {"id", r.id},
        {"drive_id", r.drive_id},
        {"type", to_string(r.type)},
        {"priority", to_string(r.priority)},
        {"source_path", r.source_path.string()},
        {"target_path", r.target_path.string()},
        {"status", to_string(r.status)},
        {"progress", r.progress},
        {"total_bytes", r.total_bytes},
        {"processed_bytes", r.processed_bytes},
        {"metadata", r.metadata},
        {"created_at", util::toMicros(r.created_at)},
        {"updated_at", util::toMicros(r.updated_at)},
        {"result", r.result}
    };
    if (r.error) j["error"] = *r.error;
    if (r.error_kind) j["error_kind"] = types::to_string(*r.error_kind);
}

void to_json(nlohmann::json& j, const TaskStatistics& s) {
    j = {
        {"pending", s.pending},
        {"running", s.running},
        {"completed", s.completed},
        {"failed", s.failed},
        {"cancelled", s.cancelled},
        {"max_workers", s.max_workers},
        {"completed_buffer_size", s.completed_buffer_size}
    };
}

}
