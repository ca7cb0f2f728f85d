#include <gtest/gtest.h>
#include "VaultTestBase.hpp"
#include "crypto/util/encrypt.hpp"
#include "crypto/util/hash.hpp"

#include <sodium.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <vector>

#include <unistd.h>

using namespace dredge;
using namespace dredge::crypto::util;

namespace {

std::vector<uint8_t> bytes(const std::string& s) { return {s.begin(), s.end()}; }

}

TEST(EnvelopeTest, RoundTripText) {
    const auto envelope = encrypt(std::string("Host github.com"), "pw");
    EXPECT_EQ(decrypt_to_string(envelope, "pw"), "Host github.com");
}

TEST(EnvelopeTest, RoundTripEmptyPlaintext) {
    const auto envelope = encrypt(std::vector<uint8_t>{}, "pw");
    EXPECT_EQ(envelope.size(), MIN_ENVELOPE_SIZE);
    EXPECT_TRUE(decrypt(envelope, "pw").empty());
}

TEST(EnvelopeTest, RoundTripBinary) {
    std::vector<uint8_t> payload(1024);
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<uint8_t>(i * 31);
    EXPECT_EQ(decrypt(encrypt(payload, "pw"), "pw"), payload);
}

TEST(EnvelopeTest, DerivesArgon2idKeyWithFourLanes) {
    // t=1, m=64 MiB, p=4, salt 00..0f
    std::array<uint8_t, SALT_SIZE> salt{};
    for (size_t i = 0; i < salt.size(); ++i) salt[i] = static_cast<uint8_t>(i);

    std::array<uint8_t, KEY_SIZE> key{};
    derive_key("correct horse battery", salt.data(), key.data());

    std::string hex(KEY_SIZE * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), key.data(), key.size());
    hex.resize(KEY_SIZE * 2);

    EXPECT_EQ(hex, "70b433957d19740579911a0146b25d75ecb6b9addc4becbccfa3f8355321a6d0");
}

TEST(EnvelopeTest, LayoutIsSaltNonceCiphertextTag) {
    const auto plaintext = bytes("hello");
    const auto envelope = encrypt(plaintext, "pw");
    EXPECT_EQ(envelope.size(), SALT_SIZE + NONCE_SIZE + plaintext.size() + TAG_SIZE);
}

TEST(EnvelopeTest, WrongPasswordRejected) {
    const auto envelope = encrypt(bytes("secret"), "right");
    EXPECT_DREDGE_ERROR(decrypt(envelope, "wrong"), ErrorCode::WrongPassword);
}

TEST(EnvelopeTest, EveryFlippedCiphertextBitIsDetected) {
    const auto envelope = encrypt(bytes("abc"), "pw");
    for (size_t i = SALT_SIZE + NONCE_SIZE; i < envelope.size(); ++i) {
        auto tampered = envelope;
        tampered[i] ^= 0x01;
        EXPECT_DREDGE_ERROR(decrypt(tampered, "pw"), ErrorCode::WrongPassword);
    }
}

TEST(EnvelopeTest, TamperedSaltOrNonceIsDetected) {
    const auto envelope = encrypt(bytes("abc"), "pw");

    auto badSalt = envelope;
    badSalt[0] ^= 0x80;
    EXPECT_DREDGE_ERROR(decrypt(badSalt, "pw"), ErrorCode::WrongPassword);

    auto badNonce = envelope;
    badNonce[SALT_SIZE] ^= 0x80;
    EXPECT_DREDGE_ERROR(decrypt(badNonce, "pw"), ErrorCode::WrongPassword);
}

TEST(EnvelopeTest, IdenticalInputsProduceDistinctEnvelopes) {
    const auto a = encrypt(bytes("same"), "pw");
    const auto b = encrypt(bytes("same"), "pw");
    EXPECT_NE(a, b);
    EXPECT_FALSE(std::equal(a.begin(), a.begin() + SALT_SIZE, b.begin()));
    EXPECT_FALSE(std::equal(a.begin() + SALT_SIZE, a.begin() + SALT_SIZE + NONCE_SIZE, b.begin() + SALT_SIZE));
}

TEST(EnvelopeTest, ShortEnvelopeIsTooShort) {
    EXPECT_DREDGE_ERROR(decrypt(std::vector<uint8_t>(MIN_ENVELOPE_SIZE - 1, 0), "pw"), ErrorCode::TooShort);
    EXPECT_DREDGE_ERROR(decrypt({}, "pw"), ErrorCode::TooShort);
}

TEST(EnvelopeTest, TooShortBelongsToCorrupted) {
    try {
        (void)decrypt(std::vector<uint8_t>(3, 0), "pw");
        FAIL() << "expected TooShort";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::TooShort);
        EXPECT_EQ(e.category(), ErrorCode::Corrupted);
    }
}

TEST(EnvelopeTest, EmptyPasswordRejected) {
    EXPECT_DREDGE_ERROR(encrypt(bytes("x"), ""), ErrorCode::InvalidInput);
}

TEST(Base64Test, EncodesStandardPaddedAlphabet) {
    EXPECT_EQ(b64_encode(bytes("hi?")), "aGk/");
    EXPECT_EQ(b64_encode(bytes("a")), "YQ==");
    EXPECT_EQ(b64_decode("YQ=="), bytes("a"));
    EXPECT_TRUE(b64_decode("").empty());
}

TEST(Base64Test, RejectsGarbage) {
    EXPECT_DREDGE_ERROR(b64_decode("not base64!"), ErrorCode::Corrupted);
}

TEST(HashTest, Sha256OfBytesAndFileAgree) {
    // sha256("abc")
    constexpr auto expected = "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    EXPECT_EQ(crypto::hash::sha256(bytes("abc")), expected);

    const auto file = fs::temp_directory_path() / ("dredge-hash-" + std::to_string(::getpid()));
    {
        std::ofstream out(file, std::ios::binary);
        out << "abc";
    }
    EXPECT_EQ(crypto::hash::sha256(file), expected);
    fs::remove(file);
}
