#include <gtest/gtest.h>
#include "crypto/ChunkCipher.hpp"
#include "crypto/Hash.hpp"
#include "test_helpers.hpp"

#include <sodium.h>

using namespace stratus::crypto;
using namespace stratus::test;

namespace {

std::vector<uint8_t> testKey() {
    std::vector<uint8_t> key(CHUNK_KEY_SIZE);
    for (size_t i = 0; i < key.size(); ++i) key[i] = static_cast<uint8_t>(i * 3 + 1);
    return key;
}

ChunkCipher xchacha() {
    std::vector<uint8_t> nonce(ChunkCipher::nonceSize(CipherSuite::XChaCha20Poly1305), 0x42);
    return {testKey(), CipherSuite::XChaCha20Poly1305, nonce};
}

}

TEST(ChunkCipherTest, ChunkDecryptsToItsPlaintext) {
    const auto cipher = xchacha();
    const auto plain = patternBytes(1000);

    const auto sealed = cipher.encryptChunk(3, plain);
    EXPECT_EQ(sealed.size(), plain.size() + CHUNK_TAG_SIZE);
    EXPECT_NE(std::vector<uint8_t>(sealed.begin(), sealed.begin() + 16), std::vector<uint8_t>(plain.begin(), plain.begin() + 16));
    EXPECT_EQ(cipher.decryptChunk(3, sealed), plain);
}

TEST(ChunkCipherTest, ChunksCannotBeReordered) {
    const auto cipher = xchacha();
    const auto sealed = cipher.encryptChunk(0, patternBytes(64));
    EXPECT_THROW((void)cipher.decryptChunk(1, sealed), std::runtime_error);
}

TEST(ChunkCipherTest, TamperingIsDetected) {
    const auto cipher = xchacha();
    auto sealed = cipher.encryptChunk(0, patternBytes(64));
    sealed[10] ^= 0x01;
    EXPECT_THROW((void)cipher.decryptChunk(0, sealed), std::runtime_error);

    EXPECT_THROW((void)cipher.decryptChunk(0, std::vector<uint8_t>(4)), std::runtime_error);
}

TEST(ChunkCipherTest, SameIndexDifferentNonceDiffers) {
    const auto a = ChunkCipher::create(testKey());
    const auto b = ChunkCipher::create(testKey());
    EXPECT_NE(a.baseNonce(), b.baseNonce());
    EXPECT_NE(a.encryptChunk(0, patternBytes(32)), b.encryptChunk(0, patternBytes(32)));
    EXPECT_EQ(a.suite(), ChunkCipher::preferredSuite());
}

TEST(ChunkCipherTest, RejectsBadKeyAndNonce) {
    EXPECT_THROW(ChunkCipher(std::vector<uint8_t>(16), CipherSuite::XChaCha20Poly1305,
                             std::vector<uint8_t>(ChunkCipher::nonceSize(CipherSuite::XChaCha20Poly1305))),
                 std::invalid_argument);
    EXPECT_THROW(ChunkCipher(testKey(), CipherSuite::XChaCha20Poly1305, std::vector<uint8_t>(5)), std::invalid_argument);
}

TEST(ChunkCipherTest, EncryptedSizeCountsOneTagPerChunk) {
    EXPECT_EQ(ChunkCipher::encryptedSize(0, 4), CHUNK_TAG_SIZE);
    EXPECT_EQ(ChunkCipher::encryptedSize(8, 4), 8 + 2 * CHUNK_TAG_SIZE);
    EXPECT_EQ(ChunkCipher::encryptedSize(9, 4), 9 + 3 * CHUNK_TAG_SIZE);
}

TEST(ChunkCipherTest, SuiteNamesAndBase64) {
    EXPECT_EQ(cipherSuiteFromString(to_string(CipherSuite::Aes256Gcm)), CipherSuite::Aes256Gcm);
    EXPECT_EQ(cipherSuiteFromString("xchacha20poly1305"), CipherSuite::XChaCha20Poly1305);
    EXPECT_THROW(cipherSuiteFromString("rot13"), std::invalid_argument);

    const auto bytes = patternBytes(41);
    EXPECT_EQ(b64_decode(b64_encode(bytes)), bytes);
    EXPECT_THROW(b64_decode("@@not base64@@"), std::runtime_error);
}

TEST(ChunkCipherTest, KeyFileMustHoldExactly32Bytes) {
    TempDir dir("stratus-key");
    const auto key = testKey();
    writeFile(dir / "good.key", std::string(key.begin(), key.end()));
    writeFile(dir / "short.key", "too short");

    EXPECT_EQ(ChunkCipher::loadKey(dir / "good.key"), key);
    EXPECT_THROW(ChunkCipher::loadKey(dir / "short.key"), std::runtime_error);
    EXPECT_THROW(ChunkCipher::loadKey(dir / "missing.key"), std::runtime_error);
}

TEST(HashTest, StreamingMatchesOneShot) {
    const auto data = patternBytes(5000);

    StreamingHash h;
    h.update(data.data(), 1234);
    h.update(data.data() + 1234, data.size() - 1234);
    EXPECT_EQ(h.finalHex(), Hash::blake2b(data));

    TempDir dir("stratus-hash");
    writeFile(dir / "f.bin", std::string(data.begin(), data.end()));
    EXPECT_EQ(Hash::blake2b(dir / "f.bin"), Hash::blake2b(data));
    EXPECT_NE(Hash::blake2b(patternBytes(5000, 8)), Hash::blake2b(data));
}
