#include <gtest/gtest.h>
#include "VaultTestBase.hpp"
#include "storage/ItemStore.hpp"
#include "util/files.hpp"

using namespace dredge;
using namespace dredge::storage;
using namespace dredge::types;

class ItemStoreTest : public VaultTestBase {};

TEST_F(ItemStoreTest, CreateAndLoadSshConfig) {
    ItemStore store(*paths);
    const auto id = store.create("abc", makeTextItem("SSH Config", "Host github.com", {"ssh"}), password);
    EXPECT_EQ(id, "abc");

    const auto item = store.load("abc", password);
    EXPECT_EQ(item.id, "abc");
    EXPECT_EQ(item.title, "SSH Config");
    EXPECT_EQ(item.tags, std::vector<std::string>{"ssh"});
    EXPECT_EQ(item.content, "Host github.com");
    EXPECT_EQ(item.kind, ItemKind::Text);
}

TEST_F(ItemStoreTest, ItemFilesAreOwnerOnly) {
    ItemStore store(*paths);
    store.create("abc", makeTextItem("t", "c"), password);
    const auto perms = fs::status(paths->item("abc")).permissions() & fs::perms::all;
    EXPECT_EQ(perms, fs::perms::owner_read | fs::perms::owner_write);
}

TEST_F(ItemStoreTest, CreateNeverOverwrites) {
    ItemStore store(*paths);
    store.create("abc", makeTextItem("first", "one"), password);
    EXPECT_DREDGE_ERROR(store.create("abc", makeTextItem("second", "two"), password), ErrorCode::AlreadyExists);
    EXPECT_EQ(store.load("abc", password).title, "first");
}

TEST_F(ItemStoreTest, GeneratedIdsUseConfiguredLength) {
    ItemStore store(*paths);
    const auto id = store.create(std::nullopt, makeTextItem("t", "c"), password);
    EXPECT_EQ(id.size(), 3u);
    EXPECT_TRUE(store.exists(id));
}

TEST_F(ItemStoreTest, CollisionsAreRetried) {
    std::vector<std::string> ids = {"aaa", "aaa", "bbb"};
    size_t next = 0;
    ItemStore store(*paths, [&] { return ids.at(next++); }, 10);

    EXPECT_EQ(store.create(std::nullopt, makeTextItem("1", "c"), password), "aaa");
    EXPECT_EQ(store.create(std::nullopt, makeTextItem("2", "c"), password), "bbb");
    EXPECT_EQ(next, 3u);
}

TEST_F(ItemStoreTest, ExhaustedIdSpace) {
    ItemStore store(*paths, [] { return std::string("zzz"); }, 4);
    store.create("zzz", makeTextItem("taken", "c"), password);

    try {
        store.create(std::nullopt, makeTextItem("t", "c"), password);
        FAIL() << "expected IdExhausted";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::IdExhausted);
        EXPECT_EQ(e.category(), ErrorCode::AlreadyExists);
    }
}

TEST_F(ItemStoreTest, UpdateBumpsModified) {
    ItemStore store(*paths);
    auto item = makeTextItem("t", "before");
    item.created = item.modified = 1000;
    store.create("abc", item, password);

    auto loaded = store.load("abc", password);
    loaded.content = "after";
    store.update("abc", loaded, password);

    const auto updated = store.load("abc", password);
    EXPECT_EQ(updated.content, "after");
    EXPECT_EQ(updated.created, 1000);
    EXPECT_GT(updated.modified, 1000);
}

TEST_F(ItemStoreTest, MissingItems) {
    ItemStore store(*paths);
    EXPECT_DREDGE_ERROR(store.load("nope", password), ErrorCode::NotFound);
    EXPECT_DREDGE_ERROR(store.update("nope", makeTextItem("t", "c"), password), ErrorCode::NotFound);
    EXPECT_DREDGE_ERROR(store.remove("nope"), ErrorCode::NotFound);
    EXPECT_FALSE(store.exists("nope"));
}

TEST_F(ItemStoreTest, RejectsMalformedIds) {
    ItemStore store(*paths);
    EXPECT_DREDGE_ERROR(store.create("../x", makeTextItem("t", "c"), password), ErrorCode::InvalidInput);
    EXPECT_DREDGE_ERROR(store.load("a/b", password), ErrorCode::InvalidInput);
    EXPECT_FALSE(store.exists("a/b"));
}

TEST_F(ItemStoreTest, RejectsInvalidItems) {
    ItemStore store(*paths);
    EXPECT_DREDGE_ERROR(store.create("abc", makeTextItem("", "c"), password), ErrorCode::InvalidInput);
    EXPECT_FALSE(store.exists("abc"));
}

TEST_F(ItemStoreTest, ListIsSortedAndSkipsStrays) {
    ItemStore store(*paths);
    store.create("b", makeTextItem("t", "c"), password);
    store.create("a", makeTextItem("t", "c"), password);
    fs::create_directory(paths->items / "subdir");
    util::atomicWrite(paths->items / "not valid", std::string_view("x"));

    EXPECT_EQ(store.list(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(ItemStoreTest, RemoveDeletes) {
    ItemStore store(*paths);
    store.create("abc", makeTextItem("t", "c"), password);
    store.remove("abc");
    EXPECT_FALSE(store.exists("abc"));
    EXPECT_TRUE(store.list().empty());
}

TEST_F(ItemStoreTest, RenameMovesWithoutOverwriting) {
    ItemStore store(*paths);
    store.create("old", makeTextItem("t", "c"), password);
    store.create("busy", makeTextItem("t2", "c2"), password);

    EXPECT_DREDGE_ERROR(store.rename("old", "busy"), ErrorCode::AlreadyExists);
    EXPECT_DREDGE_ERROR(store.rename("old", "bad id"), ErrorCode::InvalidInput);
    EXPECT_DREDGE_ERROR(store.rename("ghost", "new"), ErrorCode::NotFound);

    store.rename("old", "new");
    EXPECT_FALSE(store.exists("old"));
    EXPECT_EQ(store.load("new", password).id, "new");
    EXPECT_EQ(store.load("busy", password).title, "t2");
}

TEST_F(ItemStoreTest, WrongPasswordAndTruncationFailFast) {
    ItemStore store(*paths);
    store.create("abc", makeTextItem("t", "c"), password);
    EXPECT_DREDGE_ERROR(store.load("abc", "other"), ErrorCode::WrongPassword);

    auto raw = util::readFileToVector(paths->item("abc"));
    raw.resize(raw.size() - 1);
    util::atomicWrite(paths->item("abc"), raw);
    EXPECT_DREDGE_ERROR(store.load("abc", password), ErrorCode::WrongPassword);

    raw.resize(10);
    util::atomicWrite(paths->item("abc"), raw);
    EXPECT_DREDGE_ERROR(store.load("abc", password), ErrorCode::TooShort);
}

TEST_F(ItemStoreTest, FileItemsRoundTrip) {
    ItemStore store(*paths);
    const std::vector<uint8_t> raw = {0, 1, 2, 250, 251};
    store.create("bin", makeFileItem("blob", "blob.bin", raw), password);

    const auto item = store.load("bin", password);
    EXPECT_EQ(item.kind, ItemKind::File);
    EXPECT_EQ(decodeFileContent(item), raw);
}
