#include "link/LinkManager.hpp"
#include "storage/ItemStore.hpp"
#include "crypto/util/hash.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <ranges>

using namespace dredge;
using namespace dredge::link;
using namespace dredge::log;
namespace fs = std::filesystem;

LinkManager::LinkManager(const types::VaultPaths& paths, storage::ItemStore& store)
    : paths_(paths), store_(store), manifest_(paths.manifest) {}

void LinkManager::writeSpawnedFile(const std::string& id, const std::string& content) const {
    util::ensureDirectory(paths_.spawned);
    util::atomicWrite(paths_.spawnedFile(id), content, util::OWNER_RW);
}

bool LinkManager::removeSpawnedFile(const std::string& id) const {
    return util::removeIfExists(paths_.spawnedFile(id));
}

void LinkManager::link(const std::string& id, const fs::path& target, const bool force, const std::string& password) {
    types::validateId(id);

    if (const auto existing = manifest_.find(id))
        throw Error(ErrorCode::AlreadyExists, "Item " + id + " already linked to " + existing->path.string());

    if (!target.is_absolute())
        throw Error(ErrorCode::InvalidInput, "Target path must be absolute: " + target.string());

    const auto item = store_.load(id, password);
    if (!item.isText()) throw Error(ErrorCode::InvalidInput, "Cannot link binary item " + id + " (text items only)");

    std::error_code ec;
    if (!fs::is_directory(target.parent_path(), ec))
        throw Error(ErrorCode::IOFailure, "Parent directory does not exist: " + target.parent_path().string());

    if (const auto st = fs::symlink_status(target, ec); fs::exists(st)) {
        if (!force)
            throw Error(ErrorCode::AlreadyExists, "File already exists at " + target.string() + " (use force to overwrite)");
        if (fs::is_directory(st))
            throw Error(ErrorCode::InvalidInput, "Refusing to replace directory " + target.string());
        util::removeIfExists(target);
        Registry::link()->info("[LinkManager] Removed existing file at {} (forced)", target.string());
    }

    writeSpawnedFile(id, item.content);

    const auto spawned = paths_.spawnedFile(id);
    const auto cleanup = [&] {
        try {
            removeSpawnedFile(id);
        } catch (const Error& e) {
            Registry::link()->error("[LinkManager] Failed to remove spawned file for {}: {}", id, e.what());
        }
    };

    std::string hash;
    try {
        hash = crypto::hash::sha256(spawned);
    } catch (const Error&) {
        cleanup();
        throw;
    }

    fs::create_symlink(spawned, target, ec);
    if (ec) {
        cleanup();
        throw Error(ErrorCode::IOFailure, "Failed to create symlink at " + target.string() + ": " + ec.message());
    }

    try {
        manifest_.put(id, { target, hash });
    } catch (const Error&) {
        fs::remove(target, ec);
        cleanup();
        throw;
    }

    Registry::link()->info("[LinkManager] Linked {} -> {}", id, target.string());
    Registry::audit()->info("item linked: {} -> {}", id, target.string());
}

void LinkManager::unlink(const std::string& id, const std::optional<std::string>& password) {
    const auto entry = manifest_.find(id);
    if (!entry) throw Error(ErrorCode::NotFound, "Item " + id + " is not linked");

    if (password && store_.exists(id)) {
        try {
            syncIfNeeded(id, *password);
        } catch (const Error& e) {
            Registry::link()->warn("[LinkManager] Failed to sync {} before unlink: {}", id, e.what());
        }
    }

    bool cleanedAnything = false;
    std::error_code ec;

    // Only a symlink is ours to remove; anything else at the target was put there by someone else
    const auto st = fs::symlink_status(entry->path, ec);
    if (fs::is_symlink(st)) {
        try {
            cleanedAnything |= util::removeIfExists(entry->path);
        } catch (const Error& e) {
            Registry::link()->warn("[LinkManager] Failed to remove symlink at {}: {}", entry->path.string(), e.what());
        }
    } else if (fs::exists(st)) {
        Registry::link()->warn("[LinkManager] {} is no longer a symlink, leaving it in place", entry->path.string());
    }

    try {
        cleanedAnything |= removeSpawnedFile(id);
    } catch (const Error& e) {
        Registry::link()->warn("[LinkManager] Failed to remove spawned file for {}: {}", id, e.what());
    }

    manifest_.erase(id);

    if (!cleanedAnything)
        throw Error(ErrorCode::NothingToCleanUp,
                    "Nothing to clean up for item " + id + " (symlink and spawned file already removed)");

    Registry::link()->info("[LinkManager] Unlinked {} from {}", id, entry->path.string());
    Registry::audit()->info("item unlinked: {}", id);
}

bool LinkManager::syncIfNeeded(const std::string& id, const std::string& password) {
    auto entry = manifest_.find(id);
    if (!entry) return false;

    const auto spawned = paths_.spawnedFile(id);
    std::error_code ec;
    if (!fs::is_regular_file(spawned, ec)) {
        Registry::link()->warn("[LinkManager] Spawned file for {} is missing, nothing to sync", id);
        return false;
    }

    const auto currentHash = crypto::hash::sha256(spawned);
    if (currentHash == entry->hash) return false;

    // Spawned file was edited externally; it wins
    auto item = store_.load(id, password);
    item.content = util::readFileToString(spawned);
    item.touch();
    store_.store(item, password);

    entry->hash = currentHash;
    manifest_.put(id, *entry);

    Registry::link()->info("[LinkManager] Synced external edits of {} back into the vault", id);
    return true;
}

void LinkManager::refresh(const types::Item& item) {
    auto entry = manifest_.find(item.id);
    if (!entry) return;

    writeSpawnedFile(item.id, item.content);
    entry->hash = crypto::hash::sha256(paths_.spawnedFile(item.id));
    manifest_.put(item.id, *entry);

    Registry::link()->debug("[LinkManager] Refreshed spawned file for {}", item.id);
}

bool LinkManager::isLinked(const std::string& id) const {
    return linkedPath(id).has_value();
}

std::optional<fs::path> LinkManager::linkedPath(const std::string& id) const {
    try {
        if (const auto entry = manifest_.find(id)) return entry->path;
    } catch (const Error& e) {
        Registry::link()->warn("[LinkManager] Could not read link manifest: {}", e.what());
    }
    return std::nullopt;
}

std::vector<std::string> LinkManager::linkedIds() const {
    std::vector<std::string> ids;
    for (const auto& id : manifest_.load() | std::views::keys) ids.push_back(id);
    return ids;
}

std::vector<std::string> LinkManager::orphanedLinkIds() const {
    std::vector<std::string> orphans;
    for (const auto& id : manifest_.load() | std::views::keys)
        if (!store_.exists(id)) orphans.push_back(id);
    return orphans;
}

std::vector<std::string> LinkManager::orphanedSpawnedFiles() const {
    std::vector<std::string> orphans;
    std::error_code ec;
    if (!fs::is_directory(paths_.spawned, ec)) return orphans;

    const auto links = manifest_.load();
    for (fs::directory_iterator it(paths_.spawned, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (!links.contains(name)) orphans.push_back(name);
    }
    if (ec) throw Error(ErrorCode::IOFailure, "Failed to list " + paths_.spawned.string() + ": " + ec.message());

    std::ranges::sort(orphans);
    return orphans;
}
