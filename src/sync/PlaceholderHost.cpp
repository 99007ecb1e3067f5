#include "sync/PlaceholderHost.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <fstream>
#include <stdexcept>
#include <system_error>

using namespace stratus::sync;

LocalPlaceholderHost::LocalPlaceholderHost(fs::path syncRoot) : root_(std::move(syncRoot)) {
    if (root_.empty()) throw std::invalid_argument("Placeholder host requires a sync root");
    fs::create_directories(root_);
}

fs::path LocalPlaceholderHost::localPath(const fs::path& path) const {
    const auto rel = path.lexically_normal().relative_path();
    if (rel.empty()) throw std::invalid_argument("Empty placeholder path");
    for (const auto& part : rel)
        if (part == "..") throw std::invalid_argument("Placeholder path escapes the sync root: " + path.string());
    return root_ / rel;
}

bool LocalPlaceholderHost::exists(const fs::path& path) const {
    return fs::exists(localPath(path));
}

void LocalPlaceholderHost::createPlaceholder(const fs::path& path, const uintmax_t size, const bool isFolder) {
    const auto abs = localPath(path);
    if (isFolder) {
        fs::create_directories(abs);
        return;
    }

    fs::create_directories(abs.parent_path());
    if (!fs::exists(abs)) {
        std::ofstream(abs, std::ios::binary).close();
        if (!fs::exists(abs)) throw std::runtime_error("Failed to create placeholder: " + abs.string());
    }

    // Only a content-less file may be resized.
    if (fs::file_size(abs) != size) fs::resize_file(abs, size);

    log::Registry::mount()->trace("[LocalPlaceholderHost] Placeholder {} ({} bytes)", path.string(), size);
}

void LocalPlaceholderHost::commitHydration(const fs::path& stagingFile, const fs::path& path) {
    const auto abs = localPath(path);
    fs::create_directories(abs.parent_path());

    std::error_code ec;
    fs::rename(stagingFile, abs, ec);
    if (!ec) return;

    if (ec != std::errc::cross_device_link)
        throw fs::filesystem_error("Failed to promote staging file", stagingFile, abs, ec);

    // Staging lives on another filesystem: copy next to the target, then rename into place.
    const auto tmp = abs.parent_path() / fmt::format(".{}.hydrating", abs.filename().string());
    fs::copy_file(stagingFile, tmp, fs::copy_options::overwrite_existing);
    fs::rename(tmp, abs);
    fs::remove(stagingFile);
}

void LocalPlaceholderHost::dehydrate(const fs::path& path, const uintmax_t size) {
    const auto abs = localPath(path);
    if (!fs::is_regular_file(abs)) throw std::runtime_error("Cannot dehydrate non-file: " + abs.string());

    // Truncating to zero releases every block; growing again leaves a hole.
    fs::resize_file(abs, 0);
    fs::resize_file(abs, size);
}

void LocalPlaceholderHost::rename(const fs::path& from, const fs::path& to) {
    const auto dst = localPath(to);
    fs::create_directories(dst.parent_path());
    fs::rename(localPath(from), dst);
}

bool LocalPlaceholderHost::remove(const fs::path& path) {
    return fs::remove_all(localPath(path)) > 0;
}
