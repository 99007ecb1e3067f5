#pragma once

#include "concurrency/Task.hpp"
#include "types/Drive.hpp"
#include "types/Error.hpp"
#include "types/FileRecord.hpp"

#include <filesystem>
#include <future>
#include <memory>
#include <variant>

namespace stratus::sync {

namespace fs = std::filesystem;

using Reply = std::shared_ptr<std::promise<types::OpResult>>;

enum class ChangeKind { Created, Modified, Deleted };
enum class Resolution { KeepLocal, KeepRemote, KeepBoth };

std::string to_string(ChangeKind kind);
std::string to_string(Resolution resolution);
Resolution resolutionFromString(const std::string& str);

// Replies resolve once the mount has acted on the command. Hydration is the exception: its reply
// resolves when the content is on disk or the download has failed.
struct RequestHydration {
    fs::path path;
    Reply reply;
};

struct NotifyLocalChange {
    fs::path path;
    ChangeKind kind{ChangeKind::Modified};
    bool is_folder = false;
    Reply reply;
};

struct NotifyLocalRename {
    fs::path from;
    fs::path to;
    Reply reply;
};

// record.local_path addresses the entry; etag, remote_id and size describe the new remote state.
struct ApplyRemoteChange {
    types::FileRecord record;
    bool deleted = false;
    Reply reply;
};

struct Dehydrate {
    fs::path path;
    Reply reply;
};

struct ResolveConflict {
    fs::path path;
    Resolution resolution{Resolution::KeepRemote};
    Reply reply;
};

struct RefreshCredentials {
    types::Credentials credentials;
    Reply reply;
};

struct SetPaused {
    bool paused = true;
    Reply reply;
};

// Posted by the mount itself when one of its tasks reaches a terminal state.
struct TaskFinished {
    concurrency::TaskResult result;
    Reply reply;
};

using MountCommand = std::variant<RequestHydration, NotifyLocalChange, NotifyLocalRename, ApplyRemoteChange,
                                  Dehydrate, ResolveConflict, RefreshCredentials, SetPaused, TaskFinished>;

std::string commandName(const MountCommand& cmd);

}
