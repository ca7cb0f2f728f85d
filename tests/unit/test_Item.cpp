#include <gtest/gtest.h>
#include "VaultTestBase.hpp"
#include "types/Item.hpp"
#include "storage/ItemCodec.hpp"
#include "crypto/IdGenerator.hpp"

#include <set>

using namespace dredge;
using namespace dredge::types;

TEST(ItemTest, TextFactoryFillsFields) {
    const auto item = makeTextItem("SSH Config", "Host github.com", {"ssh", "ssh", "git"});
    EXPECT_EQ(item.kind, ItemKind::Text);
    EXPECT_EQ(item.title, "SSH Config");
    EXPECT_EQ(item.content, "Host github.com");
    EXPECT_EQ(item.tags, (std::vector<std::string>{"ssh", "git"}));
    EXPECT_NE(item.created, 0);
    EXPECT_EQ(item.created, item.modified);
    EXPECT_FALSE(item.filename);
}

TEST(ItemTest, FileFactoryEncodesAndRecordsSize) {
    const std::vector<uint8_t> raw = {0x00, 0xFF, 0x10, 0x20};
    auto item = makeFileItem("Key", "id_ed25519", raw);
    item.id = "k1";
    EXPECT_EQ(item.kind, ItemKind::File);
    EXPECT_EQ(item.filename, "id_ed25519");
    EXPECT_EQ(item.size, 4u);
    EXPECT_EQ(decodeFileContent(item), raw);
}

TEST(ItemTest, FromFilePicksKindByContent) {
    const std::string text = "user = \"me\"\nnaïve ✓\n";
    EXPECT_EQ(makeItemFromFile("cfg", "a.toml", {text.begin(), text.end()}).kind, ItemKind::Text);
    EXPECT_EQ(makeItemFromFile("bin", "a.bin", {'a', 0x00, 'b'}).kind, ItemKind::File);
    EXPECT_EQ(makeItemFromFile("bin", "a.bin", {0xC3, 0x28}).kind, ItemKind::File);
}

TEST(ItemTest, TextDetection) {
    EXPECT_TRUE(isTextContent({}));
    EXPECT_TRUE(isTextContent({'o', 'k'}));
    EXPECT_TRUE(isTextContent({0xE2, 0x9C, 0x93}));           // U+2713
    EXPECT_TRUE(isTextContent({0xF0, 0x9F, 0x98, 0x80}));     // U+1F600
    EXPECT_FALSE(isTextContent({0xE2, 0x9C}));                // truncated
    EXPECT_FALSE(isTextContent({0xC0, 0x80}));                // overlong NUL
    EXPECT_FALSE(isTextContent({0xED, 0xA0, 0x80}));          // surrogate
    EXPECT_FALSE(isTextContent({0xF4, 0x90, 0x80, 0x80}));    // above U+10FFFF
}

TEST(ItemTest, ValidationRejectsBrokenItems) {
    auto untitled = makeTextItem("", "x");
    EXPECT_DREDGE_ERROR(validate(untitled), ErrorCode::InvalidInput);

    auto file = makeFileItem("f", "f.bin", {1, 2, 3});
    file.filename.reset();
    EXPECT_DREDGE_ERROR(validate(file), ErrorCode::InvalidInput);

    file = makeFileItem("f", "f.bin", {1, 2, 3});
    file.size.reset();
    EXPECT_DREDGE_ERROR(validate(file), ErrorCode::InvalidInput);
}

TEST(ItemTest, DecodeDetectsSizeMismatch) {
    auto item = makeFileItem("f", "f.bin", {1, 2, 3});
    item.size = 4;
    EXPECT_DREDGE_ERROR(decodeFileContent(item), ErrorCode::Corrupted);

    auto text = makeTextItem("t", "x");
    EXPECT_DREDGE_ERROR(decodeFileContent(text), ErrorCode::InvalidInput);
}

TEST(ItemTest, IdSyntax) {
    EXPECT_TRUE(isValidId("abc"));
    EXPECT_TRUE(isValidId("A-_9"));
    EXPECT_FALSE(isValidId(""));
    EXPECT_FALSE(isValidId("../x"));
    EXPECT_FALSE(isValidId("a b"));
    EXPECT_FALSE(isValidId(std::string(MAX_ID_LENGTH + 1, 'a')));
    EXPECT_DREDGE_ERROR(validateId(".hidden"), ErrorCode::InvalidInput);
}

TEST(ItemCodecTest, EncodedRecordDecodesToSameItem) {
    auto item = makeTextItem("SSH Config", "Host github.com\n  User git\n\"quoted\": yes", {"ssh"});
    item.created = 1700000000;
    item.modified = 1700000500;

    const auto yaml = storage::codec::encode(item);
    EXPECT_NE(yaml.find("title: SSH Config"), std::string::npos);
    EXPECT_NE(yaml.find("type: text"), std::string::npos);
    EXPECT_NE(yaml.find("2023-11-14T22:13:20Z"), std::string::npos);
    EXPECT_EQ(yaml.find("filename"), std::string::npos);

    const auto decoded = storage::codec::decode(yaml, "abc");
    EXPECT_EQ(decoded.id, "abc");
    EXPECT_EQ(decoded.title, item.title);
    EXPECT_EQ(decoded.tags, item.tags);
    EXPECT_EQ(decoded.content, item.content);
    EXPECT_EQ(decoded.created, item.created);
    EXPECT_EQ(decoded.modified, item.modified);
}

TEST(ItemCodecTest, FileItemKeepsFilenameAndSize) {
    const auto item = makeFileItem("Key", "id_rsa", {9, 8, 7});
    const auto decoded = storage::codec::decode(storage::codec::encode(item), "k");
    EXPECT_EQ(decoded.kind, ItemKind::File);
    EXPECT_EQ(decoded.filename, "id_rsa");
    EXPECT_EQ(decoded.size, 3u);
}

TEST(ItemCodecTest, TextThatIsNotUtf8SurvivesUnchanged) {
    const std::string latin1 = "caf\xe9 = 1\n";
    const auto decoded = storage::codec::decode(storage::codec::encode(makeTextItem("Legacy", latin1)), "l");
    EXPECT_EQ(decoded.kind, ItemKind::Text);
    EXPECT_EQ(decoded.content, latin1);

    const std::string withNul("a\0b", 3);
    EXPECT_EQ(storage::codec::decode(storage::codec::encode(makeTextItem("Nul", withNul)), "n").content, withNul);
}

TEST(ItemCodecTest, MalformedRecordsAreCorrupted) {
    EXPECT_DREDGE_ERROR(storage::codec::decode("just a string", "x"), ErrorCode::Corrupted);
    EXPECT_DREDGE_ERROR(storage::codec::decode("title: [unclosed", "x"), ErrorCode::Corrupted);
    EXPECT_DREDGE_ERROR(storage::codec::decode("title: t\ntype: text\n", "x"), ErrorCode::Corrupted);
    EXPECT_DREDGE_ERROR(storage::codec::decode("title: t\ntype: weird\ncontent: {text: x}\n", "x"),
                        ErrorCode::Corrupted);
    EXPECT_DREDGE_ERROR(storage::codec::decode("title: ''\ntype: text\ncontent: {text: x}\n", "x"),
                        ErrorCode::Corrupted);
}

TEST(IdGeneratorTest, ProducesUrlSafeIdsOfConfiguredLength) {
    for (const size_t len : {1u, 3u, 8u, 64u}) {
        const crypto::IdGenerator gen({ .length = len });
        const auto id = gen.generate();
        EXPECT_EQ(id.size(), len);
        EXPECT_TRUE(isValidId(id)) << id;
    }
}

TEST(IdGeneratorTest, IdsVary) {
    const crypto::IdGenerator gen({ .length = 8 });
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) seen.insert(gen.generate());
    EXPECT_GT(seen.size(), 45u);
}

TEST(IdGeneratorTest, RejectsBadLength) {
    EXPECT_THROW(crypto::IdGenerator({ .length = 0 }), std::invalid_argument);
    EXPECT_THROW(crypto::IdGenerator({ .length = 65 }), std::invalid_argument);
}
