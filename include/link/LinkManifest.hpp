#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace dredge::link {

struct LinkEntry {
    std::filesystem::path path;     // absolute target of the symlink
    std::string hash;               // "sha256:<hex>" of the spawned file as last synced
};

void to_json(nlohmann::json& j, const LinkEntry& e);
void from_json(const nlohmann::json& j, LinkEntry& e);

using LinkMap = std::map<std::string, LinkEntry>;

// links.json, rewritten wholesale on every mutation
class LinkManifest {
public:
    explicit LinkManifest(std::filesystem::path file) : file_(std::move(file)) {}

    // Missing file is an empty manifest. Throws Corrupted on malformed JSON.
    [[nodiscard]] LinkMap load() const;
    void save(const LinkMap& links) const;

    [[nodiscard]] std::optional<LinkEntry> find(const std::string& id) const;
    void put(const std::string& id, const LinkEntry& entry) const;

    // Returns false if there was no entry
    bool erase(const std::string& id) const;

    [[nodiscard]] const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
};

}
