#include <gtest/gtest.h>
#include "VaultTestBase.hpp"
#include "config/Config.hpp"
#include "config/paths.hpp"
#include "util/files.hpp"

using namespace dredge;
using namespace dredge::config;

class ConfigTest : public VaultTestBase {
protected:
    fs::path file() const { return dataHome / "config.yaml"; }

    void write(const std::string& yaml) const { util::atomicWrite(file(), std::string_view(yaml)); }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = loadConfig(file());
    EXPECT_EQ(cfg.vault.id_length, 3u);
    EXPECT_EQ(cfg.vault.id_max_attempts, 10u);
    EXPECT_TRUE(cfg.vault.advisory_lock);
    EXPECT_EQ(cfg.vault.undo_history, 50u);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::off);
    EXPECT_EQ(cfg.logging.max_file_size_bytes, DEFAULT_LOG_FILE_SIZE_BYTES);
    EXPECT_EQ(cfg.logDir(), paths::getDefaultLogDir());
    EXPECT_EQ(cfg.sessionRoot(), paths::getDefaultSessionRoot());
}

TEST_F(ConfigTest, ReadsSections) {
    write("vault:\n"
          "  id_length: 6\n"
          "  advisory_lock: false\n"
          "session:\n"
          "  root: /run/user/1000/dredge\n"
          "logging:\n"
          "  max_file_size_mb: 2\n"
          "  log_levels:\n"
          "    console_log_level: warning\n"
          "    subsystem_levels:\n"
          "      link: debug\n");

    const auto cfg = loadConfig(file());
    EXPECT_EQ(cfg.vault.id_length, 6u);
    EXPECT_FALSE(cfg.vault.advisory_lock);
    EXPECT_EQ(cfg.vault.id_max_attempts, 10u);
    EXPECT_EQ(cfg.sessionRoot(), fs::path("/run/user/1000/dredge"));
    EXPECT_EQ(cfg.logging.max_file_size_bytes, 2u * 1024 * 1024);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.link, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.crypto, spdlog::level::warn);
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    write("vault:\n  id_length: 0\n");
    EXPECT_DREDGE_ERROR(loadConfig(file()), ErrorCode::InvalidInput);

    write("vault:\n  id_length: 65\n");
    EXPECT_DREDGE_ERROR(loadConfig(file()), ErrorCode::InvalidInput);

    write("vault: [unterminated\n");
    EXPECT_DREDGE_ERROR(loadConfig(file()), ErrorCode::InvalidInput);
}

TEST_F(ConfigTest, SaveThenLoadKeepsSettings) {
    Config cfg;
    cfg.vault.id_length = 5;
    cfg.vault.undo_history = 7;
    cfg.logging.max_files = 2;
    cfg.logging.levels.subsystem_levels.vault = spdlog::level::err;
    cfg.save(file());

    const auto loaded = loadConfig(file());
    EXPECT_EQ(loaded.vault.id_length, 5u);
    EXPECT_EQ(loaded.vault.undo_history, 7u);
    EXPECT_EQ(loaded.logging.max_files, 2u);
    EXPECT_EQ(loaded.logging.levels.subsystem_levels.vault, spdlog::level::err);
}

TEST_F(ConfigTest, PathsFollowDataHome) {
    EXPECT_EQ(paths::getDataHome(), dataHome);
    EXPECT_EQ(paths::getVaultRoot(), dataHome / "dredge");
    EXPECT_EQ(types::VaultPaths::fromEnvironment().items, dataHome / "dredge" / "items");
    EXPECT_EQ(paths->trashedItem("abc"), dataHome / "Trash" / "files" / "dredge-abc");
    EXPECT_EQ(paths->trashInfoFile("abc"), dataHome / "Trash" / "info" / "dredge-abc.trashinfo");
}
