#pragma once

#include <sodium.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>

namespace stratus::crypto::util {

// Crockford Base32 (no I, L, O, U); filesystem safe
static inline constexpr char kBase32Crockford[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

enum class Case { Upper, Lower };

inline void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

inline std::string b32_crockford_encode(const uint8_t* data, const size_t len, const Case out_case = Case::Upper) {
    if (len == 0) return {};
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kBase32Crockford[(buffer >> bits) & 0x1F]);
        }
    }

    if (bits > 0) out.push_back(kBase32Crockford[(buffer << (5 - bits)) & 0x1F]);

    if (out_case == Case::Lower)
        std::ranges::transform(out, out.begin(),
            [](const unsigned char c){ return static_cast<char>(std::tolower(c)); });

    return out;
}

// RFC 4122 v4 UUID (hex string)
inline std::string uuid4_hex() {
    ensure_sodium_init();
    std::array<uint8_t, 16> b{};
    randombytes_buf(b.data(), b.size());
    b[6] = (b[6] & 0x0F) | 0x40; // version 4
    b[8] = (b[8] & 0x3F) | 0x80; // variant

    char s[37];
    std::snprintf(s, sizeof s,
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
        b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return {s};
}

inline std::string derive_namespace_prefix(const std::string_view namespace_token,
                                           const size_t prefix_chars,
                                           const Case out_case) {
    if (namespace_token.empty() || prefix_chars == 0) return {};
    ensure_sodium_init();

    static constexpr char kCtx[] = "stratus/ns-prefix/v1";

    std::array<uint8_t, 16> digest{};
    crypto_generichash_state st;
    if (crypto_generichash_init(&st, nullptr, 0, digest.size()) != 0)
        throw std::runtime_error("blake2 init failed");

    crypto_generichash_update(&st, reinterpret_cast<const unsigned char*>(kCtx), sizeof(kCtx) - 1);
    crypto_generichash_update(&st,
        reinterpret_cast<const unsigned char*>(namespace_token.data()), namespace_token.size());
    crypto_generichash_final(&st, digest.data(), digest.size());

    std::string enc = b32_crockford_encode(digest.data(), digest.size(), out_case);
    if (enc.size() < prefix_chars) enc.append(prefix_chars - enc.size(), '0');
    enc.resize(prefix_chars);
    return enc;
}

}
