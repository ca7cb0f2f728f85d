#include "config/paths.hpp"
#include "types/Error.hpp"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>

namespace dredge::paths {

static std::filesystem::path getUserHomeDir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        if (const passwd* pw = getpwuid(geteuid()); pw && pw->pw_dir) home = pw->pw_dir;
    }
    if (!home || !*home) throw Error(ErrorCode::IOFailure, "Unable to determine home directory");
    return {home};
}

std::filesystem::path getDataHome() {
    if (const char* base = std::getenv(DATA_HOME_ENV); base && *base) return {base};
    return getUserHomeDir() / ".local" / "share";
}

std::filesystem::path getVaultRoot() { return getDataHome() / APP_NAME; }

std::filesystem::path getConfigPath() { return getVaultRoot() / "config.yaml"; }

std::filesystem::path getDefaultLogDir() { return getVaultRoot() / "logs"; }

std::filesystem::path getDefaultSessionRoot() {
    if (const char* tmp = std::getenv("TMPDIR"); tmp && *tmp) return std::filesystem::path(tmp) / APP_NAME;
    return std::filesystem::path("/tmp") / APP_NAME;
}

}
