#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>

namespace stratus::sync {

namespace fs = std::filesystem;

// Directives the engine issues to the OS hydration layer. Paths are relative to the sync root.
class PlaceholderHost {
public:
    virtual ~PlaceholderHost() = default;

    // Creates or refreshes a content-less entry of the given logical size. Only called for
    // entries that hold no local content.
    virtual void createPlaceholder(const fs::path& path, uintmax_t size, bool isFolder) = 0;

    // Atomically replaces the placeholder with the verified staging file.
    virtual void commitHydration(const fs::path& stagingFile, const fs::path& path) = 0;

    // Drops local content while keeping the entry visible at its logical size.
    virtual void dehydrate(const fs::path& path, uintmax_t size) = 0;

    virtual void rename(const fs::path& from, const fs::path& to) = 0;

    virtual bool remove(const fs::path& path) = 0;

    [[nodiscard]] virtual bool exists(const fs::path& path) const = 0;

    [[nodiscard]] virtual fs::path localPath(const fs::path& path) const = 0;
};

using PlaceholderHostPtr = std::shared_ptr<PlaceholderHost>;

// Reference host that realises placeholders as sparse files under a plain directory.
class LocalPlaceholderHost final : public PlaceholderHost {
public:
    explicit LocalPlaceholderHost(fs::path syncRoot);

    void createPlaceholder(const fs::path& path, uintmax_t size, bool isFolder) override;
    void commitHydration(const fs::path& stagingFile, const fs::path& path) override;
    void dehydrate(const fs::path& path, uintmax_t size) override;
    void rename(const fs::path& from, const fs::path& to) override;
    bool remove(const fs::path& path) override;
    [[nodiscard]] bool exists(const fs::path& path) const override;
    [[nodiscard]] fs::path localPath(const fs::path& path) const override;

    [[nodiscard]] const fs::path& root() const { return root_; }

private:
    fs::path root_;
};

}
