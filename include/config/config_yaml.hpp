#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace dredge::config;

template<>
struct convert<VaultConfig> {
    static Node encode(const VaultConfig& rhs) {
        Node node;
        node["id_length"] = rhs.id_length;
        node["id_max_attempts"] = rhs.id_max_attempts;
        node["advisory_lock"] = rhs.advisory_lock;
        node["undo_history"] = rhs.undo_history;
        return node;
    }

    static bool decode(const Node& node, VaultConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.id_length = node["id_length"].as<unsigned int>(3);
        rhs.id_max_attempts = node["id_max_attempts"].as<unsigned int>(10);
        rhs.advisory_lock = node["advisory_lock"].as<bool>(true);
        rhs.undo_history = node["undo_history"].as<unsigned int>(50);
        return true;
    }
};

template<>
struct convert<SessionConfig> {
    static Node encode(const SessionConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        return node;
    }

    static bool decode(const Node& node, SessionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("");
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["dredge"]  = to_std_string(spdlog::level::to_string_view(rhs.dredge));
        node["crypto"]  = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["link"]    = to_std_string(spdlog::level::to_string_view(rhs.link));
        node["auth"]    = to_std_string(spdlog::level::to_string_view(rhs.auth));
        node["vault"]   = to_std_string(spdlog::level::to_string_view(rhs.vault));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.dredge = spdlog::level::from_str(node["dredge"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("info"));
        rhs.link = spdlog::level::from_str(node["link"].as<std::string>("info"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("info"));
        rhs.vault = spdlog::level::from_str(node["vault"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("off"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["dir"] = rhs.dir.string();
        node["max_file_size_mb"] = rhs.max_file_size_bytes / (1024 * 1024);
        node["max_files"] = rhs.max_files;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.dir = node["dir"].as<std::string>("");
        rhs.max_file_size_bytes = node["max_file_size_mb"].as<uintmax_t>(10) * 1024 * 1024;
        rhs.max_files = node["max_files"].as<unsigned int>(5);
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
