#include "link/LinkManifest.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

namespace dredge::link {

void to_json(nlohmann::json& j, const LinkEntry& e) {
    j = {
        {"path", e.path.string()},
        {"hash", e.hash}
    };
}

void from_json(const nlohmann::json& j, LinkEntry& e) {
    e.path = j.at("path").get<std::string>();
    e.hash = j.at("hash").get<std::string>();
}

LinkMap LinkManifest::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) return {};

    try {
        return nlohmann::json::parse(util::readFileToString(file_)).get<LinkMap>();
    } catch (const nlohmann::json::exception& e) {
        throw Error(ErrorCode::Corrupted, "Failed to parse link manifest " + file_.string() + ": " + e.what());
    }
}

void LinkManifest::save(const LinkMap& links) const {
    const nlohmann::json j = links;
    util::atomicWrite(file_, j.dump(2), util::OWNER_RW);
}

std::optional<LinkEntry> LinkManifest::find(const std::string& id) const {
    const auto links = load();
    if (const auto it = links.find(id); it != links.end()) return it->second;
    return std::nullopt;
}

void LinkManifest::put(const std::string& id, const LinkEntry& entry) const {
    auto links = load();
    links[id] = entry;
    save(links);
}

bool LinkManifest::erase(const std::string& id) const {
    auto links = load();
    if (links.erase(id) == 0) return false;
    save(links);
    return true;
}

}
