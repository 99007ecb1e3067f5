#include "sync/RemoteFeed.hpp"

using namespace stratus::sync;
using namespace stratus::transfer;

PollingRemoteFeed::PollingRemoteFeed(BackendPtr backend, std::filesystem::path prefix)
    : backend_(std::move(backend)), prefix_(std::move(prefix)) {
    if (!backend_) throw std::invalid_argument("PollingRemoteFeed requires a backend");
}

std::vector<RemoteChange> PollingRemoteFeed::poll() {
    const auto listing = backend_->list(prefix_);

    std::scoped_lock lock(mutex_);
    std::vector<RemoteChange> changes;
    std::unordered_map<std::string, RemoteObject> next;

    for (const auto& o : listing) {
        const auto key = o.path.generic_string();
        const auto it = snapshot_.find(key);
        if (it == snapshot_.end() || it->second.etag != o.etag)
            changes.push_back({o.path, o.remote_id, o.etag, o.size, false});
        next.emplace(key, o);
    }

    for (const auto& [key, o] : snapshot_)
        if (!next.contains(key)) changes.push_back({o.path, o.remote_id, o.etag, o.size, true});

    snapshot_ = std::move(next);
    return changes;
}
