#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace stratus::crypto {

constexpr size_t CHUNK_KEY_SIZE = 32;   // 256-bit
constexpr size_t CHUNK_TAG_SIZE = 16;   // AEAD tag appended to every chunk

enum class CipherSuite { Aes256Gcm, XChaCha20Poly1305 };

std::string to_string(CipherSuite suite);
CipherSuite cipherSuiteFromString(const std::string& str);

// Authenticated per-chunk encryption. Chunk i uses the base nonce with i folded into its
// tail and i as associated data, so chunks are independent and cannot be reordered.
class ChunkCipher {
public:
    ChunkCipher(std::vector<uint8_t> key, CipherSuite suite, std::vector<uint8_t> baseNonce);

    // Fresh random base nonce with the best suite this CPU supports.
    static ChunkCipher create(const std::vector<uint8_t>& key);
    static CipherSuite preferredSuite();
    static size_t nonceSize(CipherSuite suite);
    static std::vector<uint8_t> loadKey(const std::filesystem::path& path);

    [[nodiscard]] std::vector<uint8_t> encryptChunk(uint64_t index, const std::vector<uint8_t>& plaintext) const;
    [[nodiscard]] std::vector<uint8_t> decryptChunk(uint64_t index, const std::vector<uint8_t>& ciphertext) const;

    [[nodiscard]] CipherSuite suite() const { return suite_; }
    [[nodiscard]] const std::vector<uint8_t>& baseNonce() const { return baseNonce_; }
    [[nodiscard]] const std::vector<uint8_t>& key() const { return key_; }

    static uintmax_t encryptedSize(uintmax_t plainSize, uintmax_t chunkSize);

private:
    std::vector<uint8_t> key_;
    CipherSuite suite_;
    std::vector<uint8_t> baseNonce_;

    [[nodiscard]] std::vector<uint8_t> nonceFor(uint64_t index) const;
};

std::string b64_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> b64_decode(const std::string& b64);

}
