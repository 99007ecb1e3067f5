#pragma once

#include <algorithm>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

namespace stratus::sync {

// Entity tags produced by this drive's own finished uploads, per path. Written by upload workers
// right after finalize, read by the mount to recognise the remote feed echoing them back.
class UploadLedger {
public:
    static constexpr size_t MAX_TAGS_PER_PATH = 8;

    void record(const std::filesystem::path& path, const std::string& etag) {
        if (etag.empty()) return;
        std::scoped_lock lock(mutex_);
        auto& tags = tags_[keyOf(path)];
        if (std::ranges::find(tags, etag) != tags.end()) return;
        tags.push_back(etag);
        if (tags.size() > MAX_TAGS_PER_PATH) tags.pop_front();
    }

    [[nodiscard]] bool isOwn(const std::filesystem::path& path, const std::string& etag) const {
        if (etag.empty()) return false;
        std::scoped_lock lock(mutex_);
        const auto it = tags_.find(keyOf(path));
        return it != tags_.end() && std::ranges::find(it->second, etag) != it->second.end();
    }

    void forget(const std::filesystem::path& path) {
        std::scoped_lock lock(mutex_);
        tags_.erase(keyOf(path));
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<std::string>> tags_;

    static std::string keyOf(const std::filesystem::path& path) { return path.lexically_normal().generic_string(); }
};

}
