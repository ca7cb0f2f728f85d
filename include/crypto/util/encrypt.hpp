#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dredge::crypto::util {

constexpr size_t SALT_SIZE  = 16;      // Argon2id salt
constexpr size_t NONCE_SIZE = 12;      // GCM standard nonce
constexpr size_t TAG_SIZE   = 16;      // GCM auth tag
constexpr size_t KEY_SIZE   = 32;      // AES-256

// Envelope layout: salt || nonce || ciphertext || tag
constexpr size_t MIN_ENVELOPE_SIZE = SALT_SIZE + NONCE_SIZE + TAG_SIZE;

// Argon2id: 1 pass, 64 MiB, 4 lanes
constexpr uint32_t ARGON2_TIME_COST = 1;
constexpr uint32_t ARGON2_MEMORY_KIB = 64 * 1024;
constexpr uint32_t ARGON2_LANES = 4;

void ensure_sodium_init();

// Writes KEY_SIZE bytes into `key`. `salt` must hold SALT_SIZE bytes.
void derive_key(const std::string& password, const uint8_t* salt, uint8_t* key);

// Fresh salt and nonce on every call, so identical inputs never produce identical envelopes.
// Throws InvalidInput on an empty password.
std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext, const std::string& password);
std::vector<uint8_t> encrypt(const std::string& plaintext, const std::string& password);

// Throws TooShort on a malformed envelope, WrongPassword when the tag does not verify.
// A wrong password and a tampered envelope are reported identically.
std::vector<uint8_t> decrypt(const std::vector<uint8_t>& envelope, const std::string& password);
std::string decrypt_to_string(const std::vector<uint8_t>& envelope, const std::string& password);

}

namespace dredge::crypto::util {

std::string b64_encode(const std::vector<uint8_t>& data);

// Throws Corrupted on input that is not standard padded base64
std::vector<uint8_t> b64_decode(const std::string& b64);

}
