#pragma once

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace stratus::sync {

enum class PlaceholderState { Dehydrated, Hydrating, Hydrated, DirtyLocal, Conflicted };

enum class PlaceholderEvent {
    HydrationRequested,
    DownloadSucceeded,
    DownloadFailed,
    LocalWrite,
    UploadSucceeded,
    RemoteChange,
    Dehydrated,
    ResolvedKeepLocal,
    ResolvedKeepRemote
};

std::string to_string(PlaceholderState state);
std::string to_string(PlaceholderEvent event);
PlaceholderState placeholderStateFromString(const std::string& str);

// nullopt when the event is not legal in the given state.
std::optional<PlaceholderState> transition(PlaceholderState from, PlaceholderEvent event);

// Per-path placeholder states of one mount. Written by the owning Mount only; readable from
// callback threads.
class PlaceholderTable {
public:
    [[nodiscard]] std::optional<PlaceholderState> get(const std::filesystem::path& path) const;

    void set(const std::filesystem::path& path, PlaceholderState state);

    // Applies the event and returns the new state. Illegal transitions leave the entry untouched
    // and return nullopt. Unknown paths start out Dehydrated.
    std::optional<PlaceholderState> apply(const std::filesystem::path& path, PlaceholderEvent event);

    bool erase(const std::filesystem::path& path);

    [[nodiscard]] std::vector<std::filesystem::path> inState(PlaceholderState state) const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, PlaceholderState> states_;
};

}
