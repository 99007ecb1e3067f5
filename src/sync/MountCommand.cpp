#include "sync/MountCommand.hpp"

#include <stdexcept>

namespace stratus::sync {

std::string to_string(const ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Created: return "created";
        case ChangeKind::Modified: return "modified";
        case ChangeKind::Deleted: return "deleted";
    }
    return "unknown";
}

std::string to_string(const Resolution resolution) {
    switch (resolution) {
        case Resolution::KeepLocal: return "keep_local";
        case Resolution::KeepRemote: return "keep_remote";
        case Resolution::KeepBoth: return "keep_both";
    }
    return "unknown";
}

Resolution resolutionFromString(const std::string& str) {
    if (str == "keep_local") return Resolution::KeepLocal;
    if (str == "keep_remote") return Resolution::KeepRemote;
    if (str == "keep_both") return Resolution::KeepBoth;
    throw std::invalid_argument("Unknown conflict resolution: " + str);
}

std::string commandName(const MountCommand& cmd) {
    return std::visit([]<typename T>(const T&) -> std::string {
        if constexpr (std::is_same_v<T, RequestHydration>) return "RequestHydration";
        else if constexpr (std::is_same_v<T, NotifyLocalChange>) return "NotifyLocalChange";
        else if constexpr (std::is_same_v<T, NotifyLocalRename>) return "NotifyLocalRename";
        else if constexpr (std::is_same_v<T, ApplyRemoteChange>) return "ApplyRemoteChange";
        else if constexpr (std::is_same_v<T, Dehydrate>) return "Dehydrate";
        else if constexpr (std::is_same_v<T, ResolveConflict>) return "ResolveConflict";
        else if constexpr (std::is_same_v<T, RefreshCredentials>) return "RefreshCredentials";
        else if constexpr (std::is_same_v<T, SetPaused>) return "SetPaused";
        else return "TaskFinished";
    }, cmd);
}

}
