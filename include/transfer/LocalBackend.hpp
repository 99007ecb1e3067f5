#pragma once

#include "transfer/Backend.hpp"

#include <mutex>

namespace stratus::transfer {

// Directory-backed object store. Objects live under root at their remote path. Session parts and
// attribute sidecars live under root/.stratus and are never listed. Entity tag is the BLAKE2b of the bytes.
class LocalBackend final : public Backend {
public:
    static constexpr auto INTERNAL_DIR = ".stratus";

    explicit LocalBackend(fs::path root);

    [[nodiscard]] types::BackendType type() const override { return types::BackendType::Local; }

    SessionHandle openSession(const fs::path& remotePath, uintmax_t totalSize, const Attributes& attributes) override;
    std::string writeChunk(SessionHandle& session, uintmax_t offset, const std::vector<uint8_t>& data) override;
    RemoteObject finalize(SessionHandle& session) override;
    std::optional<SessionHandle> resume(const std::string& token) override;
    void abort(const SessionHandle& session) override;

    std::vector<uint8_t> readChunk(const fs::path& remotePath, uintmax_t offset, uintmax_t length) override;
    std::optional<RemoteObject> stat(const fs::path& remotePath) override;
    bool remove(const fs::path& remotePath) override;
    std::vector<RemoteObject> list(const fs::path& prefix) override;

    RemoteObject copy(const fs::path& from, const fs::path& to) override;
    RemoteObject move(const fs::path& from, const fs::path& to) override;

    [[nodiscard]] const fs::path& root() const { return root_; }

private:
    fs::path root_;
    std::mutex sidecarMutex_;

    [[nodiscard]] fs::path objectPath(const fs::path& remotePath) const;
    [[nodiscard]] fs::path sidecarPath(const fs::path& remotePath) const;
    [[nodiscard]] fs::path sessionDir(const std::string& token) const;
    [[nodiscard]] static fs::path normalize(const fs::path& remotePath);

    void writeSidecar(const fs::path& remotePath, const Attributes& attributes);
    [[nodiscard]] RemoteObject describe(const fs::path& remotePath);
};

}
