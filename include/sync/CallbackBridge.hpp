#pragma once

#include "sync/Mount.hpp"

#include <atomic>
#include <chrono>
#include <optional>

namespace stratus::sync {

// What the OS hydration layer gets back from a callback.
struct CallbackResult {
    enum class Status { Ok, TransientFailure, Failed };

    Status status{Status::Ok};
    std::optional<types::ErrorKind> error;
    std::string message;

    [[nodiscard]] bool ok() const { return status == Status::Ok; }
};

std::string to_string(CallbackResult::Status status);

// Turns synchronous OS callbacks into mount commands and blocks the calling thread until the
// command resolves or the callback's deadline passes. Work continues after a missed deadline;
// its outcome lands in the placeholder state for the next access.
class CallbackBridge {
public:
    using Deadline = std::optional<std::chrono::milliseconds>;

    CallbackBridge(MountPtr mount, std::chrono::milliseconds defaultDeadline);

    CallbackResult onOpen(const fs::path& path, Deadline deadline = std::nullopt);

    // Range requests hydrate the whole file.
    CallbackResult onFetchData(const fs::path& path, uintmax_t offset, uintmax_t length, Deadline deadline = std::nullopt);

    CallbackResult onLocalWrite(const fs::path& path, Deadline deadline = std::nullopt);
    CallbackResult onCreate(const fs::path& path, bool isFolder, Deadline deadline = std::nullopt);
    CallbackResult onRename(const fs::path& from, const fs::path& to, Deadline deadline = std::nullopt);
    CallbackResult onDelete(const fs::path& path, Deadline deadline = std::nullopt);
    CallbackResult onDehydrate(const fs::path& path, Deadline deadline = std::nullopt);

    [[nodiscard]] uint64_t timeouts() const { return timeouts_.load(); }
    [[nodiscard]] std::chrono::milliseconds defaultDeadline() const { return deadline_; }
    [[nodiscard]] const MountPtr& mount() const { return mount_; }

private:
    MountPtr mount_;
    std::chrono::milliseconds deadline_;
    std::atomic<uint64_t> timeouts_{0};

    CallbackResult await(std::future<types::OpResult> future, const char* what, const fs::path& path, Deadline deadline);
};

}
