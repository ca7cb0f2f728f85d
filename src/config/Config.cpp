#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/paths.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"

#include <yaml-cpp/yaml.h>

namespace dredge::config {

std::filesystem::path Config::sessionRoot() const {
    return session.root.empty() ? paths::getDefaultSessionRoot() : session.root;
}

std::filesystem::path Config::logDir() const {
    return logging.dir.empty() ? paths::getDefaultLogDir() : logging.dir;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    try {
        const YAML::Node root = YAML::LoadFile(path.string());

        if (auto node = root["vault"]) YAML::convert<VaultConfig>::decode(node, cfg.vault);
        if (auto node = root["session"]) YAML::convert<SessionConfig>::decode(node, cfg.session);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    } catch (const YAML::Exception& e) {
        throw Error(ErrorCode::InvalidInput, "Invalid config file " + path.string() + ": " + e.what());
    }

    if (cfg.vault.id_length == 0 || cfg.vault.id_length > 64)
        throw Error(ErrorCode::InvalidInput, "vault.id_length must be between 1 and 64");
    if (cfg.vault.id_max_attempts == 0)
        throw Error(ErrorCode::InvalidInput, "vault.id_max_attempts must be positive");

    return cfg;
}

void Config::save(const std::filesystem::path& path) const {
    YAML::Node root;
    root["vault"] = vault;
    root["session"] = session;
    root["logging"] = logging;

    YAML::Emitter out;
    out << root;
    if (!out.good()) throw Error(ErrorCode::IOFailure, std::string("Failed to emit config: ") + out.GetLastError());

    util::ensureDirectory(path.parent_path());
    util::atomicWrite(path, std::string_view(out.c_str(), out.size()));
}

} // namespace dredge::config
