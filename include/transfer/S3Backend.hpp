#pragma once

#include "transfer/Backend.hpp"
#include "util/curlWrappers.hpp"
#include "util/s3Helpers.hpp"

#include <chrono>
#include <map>
#include <string>
#include <curl/curl.h>

namespace stratus::transfer {

// S3-compatible object storage. Uploads are multipart; the session token carries the upload id.
class S3Backend final : public Backend {
public:
    static constexpr uintmax_t MIN_PART_SIZE = 5 * 1024 * 1024; // 5 MiB

    S3Backend(util::S3Credentials creds, std::string bucket, fs::path prefix = {},
              std::chrono::seconds requestTimeout = std::chrono::seconds(60));
    ~S3Backend() override;

    [[nodiscard]] types::BackendType type() const override { return types::BackendType::S3; }
    [[nodiscard]] uintmax_t preferredChunkSize(uintmax_t requested) const override;

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

private:
    util::S3Credentials creds_;
    std::string bucket_;
    fs::path prefix_;
    std::chrono::seconds requestTimeout_;

    [[nodiscard]] fs::path keyFor(const fs::path& remotePath) const;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash,
                                                                    const Attributes& metadata = {}) const;

    std::pair<std::string, std::string> constructPaths(CURL* curl, const fs::path& key,
                                                       const std::string& query = "") const;

    void makeSigHeaders(util::HeaderList& out, const std::string& method, const std::string& canonical,
                        const std::string& payloadHash, const Attributes& metadata = {}) const;

    [[nodiscard]] static uint32_t partNumberFor(const SessionHandle& session, uintmax_t offset);
    [[nodiscard]] static std::string encodeToken(const fs::path& key, const std::string& uploadId, const SessionHandle& session);
    [[noreturn]] static void fail(const std::string& op, const util::HttpResponse& resp);
};

}
