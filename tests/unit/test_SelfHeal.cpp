#include <gtest/gtest.h>
#include "VaultTestBase.hpp"
#include "vault/Vault.hpp"
#include "util/files.hpp"

using namespace dredge;
using namespace dredge::types;
using namespace dredge::vault;

class SelfHealTest : public VaultTestBase {
protected:
    std::unique_ptr<Vault> v;

    void SetUp() override {
        VaultTestBase::SetUp();
        v = std::make_unique<Vault>(*paths, *session);
        v->create("keep", makeTextItem("kept", "k"), password);
        v->create("gone", makeTextItem("doomed", "g"), password);
        v->link("keep", dataHome / "keep-target", false, password);
        v->link("gone", dataHome / "gone-target", false, password);
    }
};

TEST_F(SelfHealTest, RemovesOrphanedLinksAndSpawnedFiles) {
    fs::remove(paths->item("gone"));
    util::atomicWrite(paths->spawnedFile("stray"), std::string_view("leftover"));

    const auto report = v->selfHeal();
    EXPECT_EQ(report.unlinked, std::vector<std::string>{"gone"});
    EXPECT_EQ(report.removedSpawned, std::vector<std::string>{"stray"});

    EXPECT_FALSE(v->isLinked("gone"));
    EXPECT_FALSE(fs::exists(fs::symlink_status(dataHome / "gone-target")));
    EXPECT_FALSE(fs::exists(paths->spawnedFile("gone")));
    EXPECT_FALSE(fs::exists(paths->spawnedFile("stray")));

    EXPECT_TRUE(v->isLinked("keep"));
    EXPECT_TRUE(fs::exists(paths->spawnedFile("keep")));
}

TEST_F(SelfHealTest, OrphanWithNothingLeftIsStillDropped) {
    fs::remove(paths->item("gone"));
    fs::remove(dataHome / "gone-target");
    fs::remove(paths->spawnedFile("gone"));

    const auto report = v->selfHeal();
    EXPECT_EQ(report.unlinked, std::vector<std::string>{"gone"});
    EXPECT_FALSE(v->isLinked("gone"));
}

TEST_F(SelfHealTest, SecondRunChangesNothing) {
    fs::remove(paths->item("gone"));
    util::atomicWrite(paths->spawnedFile("stray"), std::string_view("leftover"));

    EXPECT_FALSE(v->selfHeal().empty());
    const auto manifestBefore = util::readFileToString(paths->manifest);

    EXPECT_TRUE(v->selfHeal().empty());
    EXPECT_EQ(util::readFileToString(paths->manifest), manifestBefore);
    EXPECT_TRUE(v->isLinked("keep"));
}

TEST_F(SelfHealTest, RunsOnceWhenSessionStarts) {
    v->verifier().create(password);
    fs::remove(paths->item("gone"));

    ScriptedPrompt prompt({password});
    EXPECT_EQ(v->obtainPassword(prompt), password);
    EXPECT_FALSE(v->isLinked("gone"));

    // Session is active now, so a new orphan survives the next obtain
    fs::remove(paths->item("keep"));
    EXPECT_EQ(v->obtainPassword(prompt), password);
    EXPECT_EQ(prompt.calls, 1);
    EXPECT_TRUE(v->isLinked("keep"));
}
