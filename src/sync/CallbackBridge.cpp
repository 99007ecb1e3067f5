#include "sync/CallbackBridge.hpp"
#include "log/Registry.hpp"

using namespace stratus::sync;
using namespace stratus::types;

std::string stratus::sync::to_string(const CallbackResult::Status status) {
    switch (status) {
        case CallbackResult::Status::Ok: return "ok";
        case CallbackResult::Status::TransientFailure: return "transient_failure";
        case CallbackResult::Status::Failed: return "failed";
    }
    return "unknown";
}

CallbackBridge::CallbackBridge(MountPtr mount, const std::chrono::milliseconds defaultDeadline)
    : mount_(std::move(mount)), deadline_(defaultDeadline) {
    if (!mount_) throw std::invalid_argument("CallbackBridge requires a mount");
    if (deadline_.count() <= 0) throw std::invalid_argument("Callback deadline must be positive");
}

CallbackResult CallbackBridge::await(std::future<OpResult> future, const char* what, const fs::path& path,
                                     const Deadline deadline) {
    const auto limit = deadline.value_or(deadline_);

    if (future.wait_for(limit) != std::future_status::ready) {
        ++timeouts_;
        log::Registry::bridge()->warn("[CallbackBridge] {} of {} on drive {} missed its {} ms deadline",
                                      what, path.string(), mount_->driveId(), limit.count());
        return {CallbackResult::Status::TransientFailure, ErrorKind::Timeout, "Callback deadline exceeded"};
    }

    const auto r = future.get();
    if (r.ok) return {};

    const bool transient = r.error == ErrorKind::Cancelled || r.error == ErrorKind::StoreUnavailable;
    log::Registry::bridge()->warn("[CallbackBridge] {} of {} on drive {} failed ({}): {}", what, path.string(),
                                  mount_->driveId(), r.error ? to_string(*r.error) : "error", r.message);
    return {transient ? CallbackResult::Status::TransientFailure : CallbackResult::Status::Failed, r.error, r.message};
}

CallbackResult CallbackBridge::onOpen(const fs::path& path, const Deadline deadline) {
    return await(mount_->requestHydration(path), "Open", path, deadline);
}

CallbackResult CallbackBridge::onFetchData(const fs::path& path, const uintmax_t offset, const uintmax_t length,
                                           const Deadline deadline) {
    log::Registry::bridge()->trace("[CallbackBridge] Fetch {} [{}, +{})", path.string(), offset, length);
    return await(mount_->requestHydration(path), "Fetch", path, deadline);
}

CallbackResult CallbackBridge::onLocalWrite(const fs::path& path, const Deadline deadline) {
    return await(mount_->notifyLocalChange(path, ChangeKind::Modified), "Write", path, deadline);
}

CallbackResult CallbackBridge::onCreate(const fs::path& path, const bool isFolder, const Deadline deadline) {
    return await(mount_->notifyLocalChange(path, ChangeKind::Created, isFolder), "Create", path, deadline);
}

CallbackResult CallbackBridge::onRename(const fs::path& from, const fs::path& to, const Deadline deadline) {
    return await(mount_->notifyLocalRename(from, to), "Rename", from, deadline);
}

CallbackResult CallbackBridge::onDelete(const fs::path& path, const Deadline deadline) {
    return await(mount_->notifyLocalChange(path, ChangeKind::Deleted), "Delete", path, deadline);
}

CallbackResult CallbackBridge::onDehydrate(const fs::path& path, const Deadline deadline) {
    return await(mount_->dehydrate(path), "Dehydrate", path, deadline);
}
