#include "crypto/util/hash.hpp"
#include "crypto/util/encrypt.hpp"
#include "types/Error.hpp"

#include <sodium.h>
#include <fstream>
#include <sstream>
#include <iomanip>

namespace dredge::crypto::hash {

namespace {

std::string format(const unsigned char (&digest)[crypto_hash_sha256_BYTES]) {
    std::ostringstream result;
    result << SHA256_PREFIX;
    for (const unsigned char b : digest)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    return result.str();
}

}

std::string sha256(const std::filesystem::path& filepath) {
    util::ensure_sodium_init();

    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw Error(ErrorCode::IOFailure, "Failed to open file for hashing: " + filepath.string());

    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);

    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        crypto_hash_sha256_update(&state, reinterpret_cast<unsigned char*>(buffer),
                                  static_cast<unsigned long long>(file.gcount()));
    }
    if (file.bad()) throw Error(ErrorCode::IOFailure, "Failed to read file for hashing: " + filepath.string());

    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256_final(&state, digest);
    return format(digest);
}

std::string sha256(const std::vector<uint8_t>& data) {
    util::ensure_sodium_init();
    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(digest, data.data(), data.size());
    return format(digest);
}

}
