#include "crypto/ChunkCipher.hpp"
#include "crypto/util/uuid.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <array>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace stratus::crypto {

static std::array<uint8_t, 8> indexBytes(const uint64_t index) {
    std::array<uint8_t, 8> out{};
    for (int i = 7; i >= 0; --i) out[7 - i] = static_cast<uint8_t>(index >> (i * 8));
    return out;
}

std::string to_string(const CipherSuite suite) {
    switch (suite) {
        case CipherSuite::Aes256Gcm: return "aes256gcm";
        case CipherSuite::XChaCha20Poly1305: return "xchacha20poly1305";
    }
    return "unknown";
}

CipherSuite cipherSuiteFromString(const std::string& str) {
    if (str == "aes256gcm") return CipherSuite::Aes256Gcm;
    if (str == "xchacha20poly1305") return CipherSuite::XChaCha20Poly1305;
    throw std::invalid_argument("Unknown cipher suite: " + str);
}

ChunkCipher::ChunkCipher(std::vector<uint8_t> key, const CipherSuite suite, std::vector<uint8_t> baseNonce)
    : key_(std::move(key)), suite_(suite), baseNonce_(std::move(baseNonce)) {
    util::ensure_sodium_init();
    if (key_.size() != CHUNK_KEY_SIZE) {
        log::Registry::crypto()->error("[ChunkCipher] Invalid key size: {} bytes", key_.size());
        throw std::invalid_argument("Invalid chunk cipher key size");
    }
    if (baseNonce_.size() != nonceSize(suite_)) {
        log::Registry::crypto()->error("[ChunkCipher] Invalid nonce size {} for {}", baseNonce_.size(), to_string(suite_));
        throw std::invalid_argument("Invalid chunk cipher nonce size");
    }
    if (suite_ == CipherSuite::Aes256Gcm && crypto_aead_aes256gcm_is_available() == 0)
        throw std::runtime_error("AES256-GCM not supported on this CPU");
}

ChunkCipher ChunkCipher::create(const std::vector<uint8_t>& key) {
    util::ensure_sodium_init();
    const auto suite = preferredSuite();
    std::vector<uint8_t> nonce(nonceSize(suite));
    randombytes_buf(nonce.data(), nonce.size());
    return {key, suite, std::move(nonce)};
}

CipherSuite ChunkCipher::preferredSuite() {
    util::ensure_sodium_init();
    return crypto_aead_aes256gcm_is_available() ? CipherSuite::Aes256Gcm : CipherSuite::XChaCha20Poly1305;
}

size_t ChunkCipher::nonceSize(const CipherSuite suite) {
    return suite == CipherSuite::Aes256Gcm ? crypto_aead_aes256gcm_NPUBBYTES
                                           : crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
}

std::vector<uint8_t> ChunkCipher::loadKey(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open drive key file: " + path.string());

    std::vector<uint8_t> buf(std::istreambuf_iterator<char>(in), {});
    if (buf.size() != CHUNK_KEY_SIZE)
        throw std::runtime_error("Drive key file must contain exactly 32 bytes: " + path.string());
    return buf;
}

std::vector<uint8_t> ChunkCipher::nonceFor(const uint64_t index) const {
    auto nonce = baseNonce_;
    const auto idx = indexBytes(index);
    const size_t off = nonce.size() - idx.size();
    for (size_t i = 0; i < idx.size(); ++i) nonce[off + i] ^= idx[i];
    return nonce;
}

std::vector<uint8_t> ChunkCipher::encryptChunk(const uint64_t index, const std::vector<uint8_t>& plaintext) const {
    const auto nonce = nonceFor(index);
    const auto ad = indexBytes(index);

    std::vector<uint8_t> ciphertext(plaintext.size() + CHUNK_TAG_SIZE);
    unsigned long long ciphertext_len = 0;

    if (suite_ == CipherSuite::Aes256Gcm)
        crypto_aead_aes256gcm_encrypt(ciphertext.data(), &ciphertext_len,
                                      plaintext.data(), plaintext.size(),
                                      ad.data(), ad.size(), nullptr, nonce.data(), key_.data());
    else
        crypto_aead_xchacha20poly1305_ietf_encrypt(ciphertext.data(), &ciphertext_len,
                                                   plaintext.data(), plaintext.size(),
                                                   ad.data(), ad.size(), nullptr, nonce.data(), key_.data());

    ciphertext.resize(ciphertext_len);
    return ciphertext;
}

std::vector<uint8_t> ChunkCipher::decryptChunk(const uint64_t index, const std::vector<uint8_t>& ciphertext) const {
    if (ciphertext.size() < CHUNK_TAG_SIZE)
        throw std::runtime_error("Encrypted chunk shorter than its authentication tag");

    const auto nonce = nonceFor(index);
    const auto ad = indexBytes(index);

    std::vector<uint8_t> plaintext(ciphertext.size() - CHUNK_TAG_SIZE);
    unsigned long long plaintext_len = 0;

    const int rc = suite_ == CipherSuite::Aes256Gcm
        ? crypto_aead_aes256gcm_decrypt(plaintext.data(), &plaintext_len, nullptr,
                                        ciphertext.data(), ciphertext.size(),
                                        ad.data(), ad.size(), nonce.data(), key_.data())
        : crypto_aead_xchacha20poly1305_ietf_decrypt(plaintext.data(), &plaintext_len, nullptr,
                                                     ciphertext.data(), ciphertext.size(),
                                                     ad.data(), ad.size(), nonce.data(), key_.data());
    if (rc != 0) {
        log::Registry::crypto()->warn("[ChunkCipher] Authentication failed for chunk {}", index);
        throw std::runtime_error("Chunk decryption failed: authentication error");
    }

    plaintext.resize(plaintext_len);
    return plaintext;
}

uintmax_t ChunkCipher::encryptedSize(const uintmax_t plainSize, const uintmax_t chunkSize) {
    const uintmax_t chunks = plainSize == 0 ? 1 : (plainSize + chunkSize - 1) / chunkSize;
    return plainSize + chunks * CHUNK_TAG_SIZE;
}

std::string b64_encode(const std::vector<uint8_t>& data) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(), data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str()));
    return result;
}

std::vector<uint8_t> b64_decode(const std::string& b64) {
    std::vector<uint8_t> decoded(b64.size());
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(), b64.c_str(), b64.size(),
                          nullptr, &out_len, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
        throw std::runtime_error("Invalid base64 input");
    decoded.resize(out_len);
    return decoded;
}

}
