#pragma once

#include <cstdint>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace dredge::config {

constexpr static uintmax_t DEFAULT_LOG_FILE_SIZE_BYTES = 10 * 1024 * 1024; // 10 MiB

struct VaultConfig {
    unsigned int id_length = 3;
    unsigned int id_max_attempts = 10;
    bool advisory_lock = true;
    unsigned int undo_history = 50;
};

struct SessionConfig {
    std::filesystem::path root;  // empty means paths::getDefaultSessionRoot()
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum dredge   = spdlog::level::info;
    spdlog::level::level_enum crypto   = spdlog::level::warn;   // Key derivation and AEAD failures
    spdlog::level::level_enum storage  = spdlog::level::info;   // Item files, trash
    spdlog::level::level_enum link     = spdlog::level::info;   // Spawn, sync, unlink
    spdlog::level::level_enum auth     = spdlog::level::info;   // Session cache, verification
    spdlog::level::level_enum vault    = spdlog::level::info;   // Rotation, self-heal
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::off;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path dir;   // empty means paths::getDefaultLogDir()
    uintmax_t max_file_size_bytes = DEFAULT_LOG_FILE_SIZE_BYTES;
    unsigned int max_files = 5;
    LogLevelsConfig levels;
};

struct Config {
    VaultConfig vault;
    SessionConfig session;
    LoggingConfig logging;

    [[nodiscard]] std::filesystem::path sessionRoot() const;
    [[nodiscard]] std::filesystem::path logDir() const;

    void save(const std::filesystem::path& path) const;
};

// Missing file yields the defaults
Config loadConfig(const std::filesystem::path& path);

} // namespace dredge::config
