#include "concurrency/OperationTable.hpp"

#include <stdexcept>

using namespace stratus::concurrency;

namespace {

template <typename P>
nlohmann::json invoke(const OperationTable::Executor<P>& fn, const P& payload, TaskContext& ctx, const TaskType type) {
    if (!fn) throw std::runtime_error("No executor registered for " + to_string(type) + " tasks");
    return fn(payload, ctx);
}

}

nlohmann::json OperationTable::dispatch(const TaskPayload& payload, TaskContext& ctx) const {
    return std::visit([&]<typename T>(const T& p) -> nlohmann::json {
        if constexpr (std::is_same_v<T, UploadPayload>) return invoke(upload, p, ctx, TaskType::Upload);
        else if constexpr (std::is_same_v<T, DownloadPayload>) return invoke(download, p, ctx, TaskType::Download);
        else if constexpr (std::is_same_v<T, SyncPayload>) return invoke(sync, p, ctx, TaskType::Sync);
        else if constexpr (std::is_same_v<T, DeletePayload>) return invoke(remove, p, ctx, TaskType::Delete);
        else if constexpr (std::is_same_v<T, CopyPayload>) return invoke(copy, p, ctx, TaskType::Copy);
        else if constexpr (std::is_same_v<T, MovePayload>) return invoke(move, p, ctx, TaskType::Move);
        else {
            const auto it = custom.find(p.name);
            if (it == custom.end()) throw std::runtime_error("No executor registered for custom task '" + p.name + "'");
            return it->second(p, ctx);
        }
    }, payload);
}
