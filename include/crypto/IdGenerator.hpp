#pragma once

#include "crypto/util/uuid.hpp"

#include <sodium.h>
#include <string>
#include <vector>

namespace stratus::crypto {

struct IdOptions {
    // Stable token the short prefix is derived from ("drive", a host name, ...).
    std::string_view namespace_token;
    size_t prefix_chars = 4;
    // 10 bytes => 16 Crockford chars
    size_t random_bytes = 10;
    char separator = '_';
    util::Case out_case = util::Case::Upper;
};

class IdGenerator {
public:
    explicit IdGenerator(const IdOptions& opt)
        : options_(opt),
          ns_prefix_(util::derive_namespace_prefix(opt.namespace_token, opt.prefix_chars, opt.out_case)) {
        util::ensure_sodium_init();
        if (options_.random_bytes == 0) throw std::invalid_argument("random_bytes must be > 0");
        if (options_.separator == ' ' || options_.separator == '\0' || options_.separator == '\n')
            throw std::invalid_argument("bad separator");
    }

    // "<ns_prefix><sep><body>"
    [[nodiscard]] std::string generate() const {
        std::vector<uint8_t> buf(options_.random_bytes);
        randombytes_buf(buf.data(), buf.size());
        const auto body = util::b32_crockford_encode(buf.data(), buf.size(), options_.out_case);
        if (ns_prefix_.empty()) return body;

        std::string id;
        id.reserve(ns_prefix_.size() + 1 + body.size());
        id.append(ns_prefix_);
        id.push_back(options_.separator);
        id.append(body);
        return id;
    }

    [[nodiscard]] std::string_view namespace_prefix() const { return ns_prefix_; }

private:
    IdOptions options_;
    std::string ns_prefix_;
};

}
