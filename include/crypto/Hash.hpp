#pragma once

#include <sodium.h>
#include <filesystem>
#include <string>
#include <vector>

namespace stratus::crypto {

class Hash {
public:
    static std::string blake2b(const std::filesystem::path& filepath);
    static std::string blake2b(const std::vector<uint8_t>& data);
};

// Incremental BLAKE2b for data that arrives in chunks.
class StreamingHash {
public:
    StreamingHash();

    void update(const uint8_t* data, size_t len);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    [[nodiscard]] std::string finalHex();

private:
    crypto_generichash_state state_{};
    bool finalized_ = false;
};

}
