#pragma once

#include "concurrency/Task.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace stratus::concurrency {

// Fixed executor table, one entry per payload alternative. Custom tasks are looked up by name.
// Executors return a JSON result and report failure by throwing.
struct OperationTable {
    template <typename P>
    using Executor = std::function<nlohmann::json(const P&, TaskContext&)>;

    Executor<UploadPayload> upload;
    Executor<DownloadPayload> download;
    Executor<SyncPayload> sync;
    Executor<DeletePayload> remove;
    Executor<CopyPayload> copy;
    Executor<MovePayload> move;
    std::unordered_map<std::string, Executor<CustomPayload>> custom;

    nlohmann::json dispatch(const TaskPayload& payload, TaskContext& ctx) const;
};

}
