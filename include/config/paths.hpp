#pragma once

#include <filesystem>

namespace dredge::paths {

constexpr const auto* APP_NAME = "dredge";
constexpr const auto* DATA_HOME_ENV = "XDG_DATA_HOME";

// $XDG_DATA_HOME, or ~/.local/share when unset
std::filesystem::path getDataHome();

std::filesystem::path getVaultRoot();
std::filesystem::path getConfigPath();
std::filesystem::path getDefaultLogDir();

// Volatile location for per-shell session state, reaped by the OS
std::filesystem::path getDefaultSessionRoot();

}
