#include "sync/PlaceholderState.hpp"

#include <mutex>
#include <stdexcept>

using namespace stratus::sync;

namespace stratus::sync {

std::string to_string(const PlaceholderState state) {
    switch (state) {
        case PlaceholderState::Dehydrated: return "dehydrated";
        case PlaceholderState::Hydrating: return "hydrating";
        case PlaceholderState::Hydrated: return "hydrated";
        case PlaceholderState::DirtyLocal: return "dirty-local";
        case PlaceholderState::Conflicted: return "conflicted";
    }
    return "unknown";
}

std::string to_string(const PlaceholderEvent event) {
    switch (event) {
        case PlaceholderEvent::HydrationRequested: return "hydration_requested";
        case PlaceholderEvent::DownloadSucceeded: return "download_succeeded";
        case PlaceholderEvent::DownloadFailed: return "download_failed";
        case PlaceholderEvent::LocalWrite: return "local_write";
        case PlaceholderEvent::UploadSucceeded: return "upload_succeeded";
        case PlaceholderEvent::RemoteChange: return "remote_change";
        case PlaceholderEvent::Dehydrated: return "dehydrated";
        case PlaceholderEvent::ResolvedKeepLocal: return "resolved_keep_local";
        case PlaceholderEvent::ResolvedKeepRemote: return "resolved_keep_remote";
    }
    return "unknown";
}

PlaceholderState placeholderStateFromString(const std::string& str) {
    if (str == "dehydrated") return PlaceholderState::Dehydrated;
    if (str == "hydrating") return PlaceholderState::Hydrating;
    if (str == "hydrated") return PlaceholderState::Hydrated;
    if (str == "dirty-local") return PlaceholderState::DirtyLocal;
    if (str == "conflicted") return PlaceholderState::Conflicted;
    throw std::invalid_argument("Unknown placeholder state: " + str);
}

std::optional<PlaceholderState> transition(const PlaceholderState from, const PlaceholderEvent event) {
    using S = PlaceholderState;
    using E = PlaceholderEvent;

    switch (from) {
        case S::Dehydrated:
            if (event == E::HydrationRequested) return S::Hydrating;
            if (event == E::LocalWrite) return S::DirtyLocal;   // OS materialised and wrote it
            if (event == E::RemoteChange) return S::Dehydrated;
            break;
        case S::Hydrating:
            if (event == E::DownloadSucceeded) return S::Hydrated;
            if (event == E::DownloadFailed) return S::Dehydrated;
            break;
        case S::Hydrated:
            if (event == E::LocalWrite) return S::DirtyLocal;
            if (event == E::RemoteChange) return S::Hydrating;
            if (event == E::Dehydrated) return S::Dehydrated;
            break;
        case S::DirtyLocal:
            if (event == E::LocalWrite) return S::DirtyLocal;
            if (event == E::UploadSucceeded) return S::Hydrated;
            if (event == E::RemoteChange) return S::Conflicted;
            break;
        case S::Conflicted:
            if (event == E::ResolvedKeepRemote) return S::Dehydrated;
            if (event == E::ResolvedKeepLocal) return S::DirtyLocal;
            if (event == E::RemoteChange) return S::Conflicted;
            break;
    }
    return std::nullopt;
}

}

std::optional<PlaceholderState> PlaceholderTable::get(const std::filesystem::path& path) const {
    std::shared_lock lock(mutex_);
    const auto it = states_.find(path.generic_string());
    if (it == states_.end()) return std::nullopt;
    return it->second;
}

void PlaceholderTable::set(const std::filesystem::path& path, const PlaceholderState state) {
    std::unique_lock lock(mutex_);
    states_[path.generic_string()] = state;
}

std::optional<PlaceholderState> PlaceholderTable::apply(const std::filesystem::path& path, const PlaceholderEvent event) {
    std::unique_lock lock(mutex_);
    const auto key = path.generic_string();
    const auto it = states_.find(key);
    const auto current = it == states_.end() ? PlaceholderState::Dehydrated : it->second;

    const auto next = transition(current, event);
    if (next) states_[key] = *next;
    return next;
}

bool PlaceholderTable::erase(const std::filesystem::path& path) {
    std::unique_lock lock(mutex_);
    return states_.erase(path.generic_string()) > 0;
}

std::vector<std::filesystem::path> PlaceholderTable::inState(const PlaceholderState state) const {
    std::vector<std::filesystem::path> out;
    std::shared_lock lock(mutex_);
    for (const auto& [path, s] : states_)
        if (s == state) out.emplace_back(path);
    return out;
}

size_t PlaceholderTable::size() const {
    std::shared_lock lock(mutex_);
    return states_.size();
}
