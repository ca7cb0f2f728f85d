#include "crypto/util/encrypt.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <argon2.h>
#include <sodium.h>
#include <array>
#include <cstring>
#include <stdexcept>

static_assert(dredge::crypto::util::NONCE_SIZE == crypto_aead_aes256gcm_NPUBBYTES);
static_assert(dredge::crypto::util::TAG_SIZE == crypto_aead_aes256gcm_ABYTES);
static_assert(dredge::crypto::util::KEY_SIZE == crypto_aead_aes256gcm_KEYBYTES);

namespace dredge::crypto::util {

namespace {

using Key = std::array<uint8_t, KEY_SIZE>;

// Wipes the derived key on every exit path
struct KeyGuard {
    Key key{};
    ~KeyGuard() { sodium_memzero(key.data(), key.size()); }
};

void ensure_aes_gcm_supported() {
    if (crypto_aead_aes256gcm_is_available() == 0)
        throw std::runtime_error("AES256-GCM not supported on this CPU");
}

}

void ensure_sodium_init() {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
}

void derive_key(const std::string& password, const uint8_t* salt, uint8_t* key) {
    const int rc = argon2id_hash_raw(ARGON2_TIME_COST, ARGON2_MEMORY_KIB, ARGON2_LANES,
                                     password.data(), password.size(),
                                     salt, SALT_SIZE,
                                     key, KEY_SIZE);
    if (rc != ARGON2_OK) {
        log::Registry::crypto()->error("[derive_key] argon2id_hash_raw failed: {}", argon2_error_message(rc));
        throw std::runtime_error(std::string("Key derivation failed: ") + argon2_error_message(rc));
    }
}

std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext, const std::string& password) {
    if (password.empty()) throw Error(ErrorCode::InvalidInput, "Password cannot be empty");

    ensure_sodium_init();
    ensure_aes_gcm_supported();

    std::vector<uint8_t> envelope(SALT_SIZE + NONCE_SIZE + plaintext.size() + TAG_SIZE);
    uint8_t* salt = envelope.data();
    uint8_t* nonce = salt + SALT_SIZE;
    uint8_t* ciphertext = nonce + NONCE_SIZE;

    randombytes_buf(salt, SALT_SIZE);
    randombytes_buf(nonce, NONCE_SIZE);

    KeyGuard guard;
    derive_key(password, salt, guard.key.data());

    unsigned long long ciphertext_len = 0;
    crypto_aead_aes256gcm_encrypt(
        ciphertext, &ciphertext_len,
        plaintext.data(), plaintext.size(),
        nullptr, 0,  // no AAD
        nullptr, nonce, guard.key.data());

    envelope.resize(SALT_SIZE + NONCE_SIZE + static_cast<size_t>(ciphertext_len));
    return envelope;
}

std::vector<uint8_t> encrypt(const std::string& plaintext, const std::string& password) {
    return encrypt(std::vector<uint8_t>(plaintext.begin(), plaintext.end()), password);
}

std::vector<uint8_t> decrypt(const std::vector<uint8_t>& envelope, const std::string& password) {
    if (envelope.size() < MIN_ENVELOPE_SIZE) {
        log::Registry::crypto()->warn("[decrypt] Envelope too short: got {} bytes, need at least {}",
                                      envelope.size(), MIN_ENVELOPE_SIZE);
        throw Error(ErrorCode::TooShort, "Encrypted data too short: got " + std::to_string(envelope.size()) +
                                         " bytes, need at least " + std::to_string(MIN_ENVELOPE_SIZE));
    }
    if (password.empty()) throw Error(ErrorCode::InvalidInput, "Password cannot be empty");

    ensure_sodium_init();
    ensure_aes_gcm_supported();

    const uint8_t* salt = envelope.data();
    const uint8_t* nonce = salt + SALT_SIZE;
    const uint8_t* ciphertext = nonce + NONCE_SIZE;
    const size_t ciphertext_len = envelope.size() - SALT_SIZE - NONCE_SIZE;

    KeyGuard guard;
    derive_key(password, salt, guard.key.data());

    std::vector<uint8_t> decrypted(ciphertext_len - TAG_SIZE);
    unsigned long long decrypted_len = 0;

    if (crypto_aead_aes256gcm_decrypt(
            decrypted.data(), &decrypted_len,
            nullptr,
            ciphertext, ciphertext_len,
            nullptr, 0,  // no AAD
            nonce, guard.key.data()) != 0) {
        sodium_memzero(decrypted.data(), decrypted.size());
        throw Error(ErrorCode::WrongPassword, "Decryption failed (wrong password or tampered data)");
    }

    decrypted.resize(static_cast<size_t>(decrypted_len));
    return decrypted;
}

std::string decrypt_to_string(const std::vector<uint8_t>& envelope, const std::string& password) {
    auto plain = decrypt(envelope, password);
    std::string out(plain.begin(), plain.end());
    sodium_memzero(plain.data(), plain.size());
    return out;
}

}

namespace dredge::crypto::util {

std::string b64_encode(const std::vector<uint8_t>& data) {
    ensure_sodium_init();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::vector<uint8_t> b64_decode(const std::string& b64) {
    ensure_sodium_init();
    std::vector<uint8_t> decoded(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.c_str(), b64.size(),
                          "\n\r", &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
        throw Error(ErrorCode::Corrupted, "Invalid base64 content");

    decoded.resize(out_len);
    return decoded;
}

}
