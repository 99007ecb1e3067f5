#pragma once

#include "types/Drive.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stratus::transfer {

namespace fs = std::filesystem;

using Attributes = std::map<std::string, std::string>;

// Attribute keys stored alongside every uploaded object.
namespace attr {
inline constexpr auto CONTENT_HASH = "content-hash";         // BLAKE2b of the plaintext
inline constexpr auto CHUNK_SIZE = "chunk-size";             // remote chunk stride
inline constexpr auto PLAIN_SIZE = "plain-size";
inline constexpr auto PLAIN_CHUNK_SIZE = "plain-chunk-size";
inline constexpr auto CIPHER = "cipher";
inline constexpr auto CIPHER_NONCE = "cipher-nonce";
}

struct RemoteObject {
    std::string remote_id;
    fs::path path;
    std::string etag;
    uintmax_t size = 0;
    Attributes attributes;
};

struct SessionHandle {
    std::string token;
    fs::path remote_path;
    uintmax_t total_size = 0;
    uintmax_t chunk_size = 0;
    std::map<uintmax_t, std::string> acknowledged;  // offset -> ack tag
    Attributes attributes;
};

// Raised by backends for failed remote operations. Transient failures are worth retrying.
class BackendError : public std::runtime_error {
public:
    BackendError(const std::string& message, const bool transient)
        : std::runtime_error(message), transient_(transient) {}

    [[nodiscard]] bool transient() const noexcept { return transient_; }

private:
    bool transient_;
};

// Resumable chunked transfer over one storage provider.
class Backend {
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual types::BackendType type() const = 0;

    // Providers with a minimum part size round the requested chunk size up.
    [[nodiscard]] virtual uintmax_t preferredChunkSize(uintmax_t requested) const { return requested; }

    // attributes[attr::CHUNK_SIZE] must hold the stride every chunk but the last is written with.
    virtual SessionHandle openSession(const fs::path& remotePath, uintmax_t totalSize, const Attributes& attributes) = 0;

    // Writing the same bytes at the same offset twice is harmless. Returns the acknowledgement tag.
    virtual std::string writeChunk(SessionHandle& session, uintmax_t offset, const std::vector<uint8_t>& data) = 0;

    virtual RemoteObject finalize(SessionHandle& session) = 0;

    // Rebuilds a handle, including the chunks the provider already acknowledged.
    // Returns nullopt when the provider no longer knows the session.
    virtual std::optional<SessionHandle> resume(const std::string& token) = 0;

    virtual void abort(const SessionHandle& session) = 0;

    virtual std::vector<uint8_t> readChunk(const fs::path& remotePath, uintmax_t offset, uintmax_t length) = 0;

    [[nodiscard]] virtual std::optional<RemoteObject> stat(const fs::path& remotePath) = 0;

    virtual bool remove(const fs::path& remotePath) = 0;

    [[nodiscard]] virtual std::vector<RemoteObject> list(const fs::path& prefix) = 0;

    virtual RemoteObject copy(const fs::path& from, const fs::path& to);

    virtual RemoteObject move(const fs::path& from, const fs::path& to);
};

using BackendPtr = std::shared_ptr<Backend>;

}
