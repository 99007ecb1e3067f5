#pragma once

#include "transfer/Backend.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace stratus::sync {

struct RemoteChange {
    std::filesystem::path path;
    std::string remote_id;
    std::string etag;
    uintmax_t size = 0;
    bool deleted = false;
};

// Source of remote change notifications. poll() throws when the remote side cannot be reached.
class RemoteFeed {
public:
    virtual ~RemoteFeed() = default;
    virtual std::vector<RemoteChange> poll() = 0;
};

using RemoteFeedPtr = std::shared_ptr<RemoteFeed>;

// Derives changes by listing the backend and diffing entity tags against the previous listing.
// The first poll reports every object.
class PollingRemoteFeed final : public RemoteFeed {
public:
    explicit PollingRemoteFeed(transfer::BackendPtr backend, std::filesystem::path prefix = {});

    std::vector<RemoteChange> poll() override;

private:
    transfer::BackendPtr backend_;
    std::filesystem::path prefix_;
    std::mutex mutex_;
    std::unordered_map<std::string, transfer::RemoteObject> snapshot_;
};

}
