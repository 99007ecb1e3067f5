#include "crypto/Hash.hpp"
#include "crypto/util/uuid.hpp"

#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

using namespace stratus::crypto;

static std::string toHex(const unsigned char* bytes, const size_t len) {
    std::ostringstream result;
    for (size_t i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    return result.str();
}

std::string Hash::blake2b(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    StreamingHash hash;
    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        hash.update(reinterpret_cast<const uint8_t*>(buffer), static_cast<size_t>(file.gcount()));
    }
    return hash.finalHex();
}

std::string Hash::blake2b(const std::vector<uint8_t>& data) {
    StreamingHash hash;
    hash.update(data);
    return hash.finalHex();
}

StreamingHash::StreamingHash() {
    util::ensure_sodium_init();
    crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES);
}

void StreamingHash::update(const uint8_t* data, const size_t len) {
    if (finalized_) throw std::logic_error("StreamingHash already finalized");
    crypto_generichash_update(&state_, data, len);
}

std::string StreamingHash::finalHex() {
    if (finalized_) throw std::logic_error("StreamingHash already finalized");
    unsigned char hash[crypto_generichash_BYTES];
    crypto_generichash_final(&state_, hash, sizeof(hash));
    finalized_ = true;
    return toHex(hash, sizeof(hash));
}
