#pragma once

#include "crypto/util/encrypt.hpp"

#include <sodium.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace dredge::crypto {

struct IdOptions {
    // Characters per ID. 3 URL-safe base64 chars => 18 bits, collisions are retried by the store.
    size_t length = 3;
};

class IdGenerator {
public:
    static constexpr size_t MAX_LENGTH = 64;

    explicit IdGenerator(const IdOptions& opt = {}) : options_(opt) {
        util::ensure_sodium_init();
        if (options_.length == 0 || options_.length > MAX_LENGTH)
            throw std::invalid_argument("id length must be in 1.." + std::to_string(MAX_LENGTH));
    }

    // Random bytes, URL-safe base64 without padding, truncated to length
    [[nodiscard]] std::string generate() const {
        std::vector<uint8_t> buf(options_.length * 3 / 4 + 3);
        randombytes_buf(buf.data(), buf.size());

        std::string encoded(sodium_base64_ENCODED_LEN(buf.size(), sodium_base64_VARIANT_URLSAFE_NO_PADDING), '\0');
        sodium_bin2base64(encoded.data(), encoded.size(), buf.data(), buf.size(),
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING);

        encoded.resize(options_.length);
        return encoded;
    }

    [[nodiscard]] const IdOptions& options() const { return options_; }

private:
    IdOptions options_;
};

}
