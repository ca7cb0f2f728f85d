#pragma once

#include "link/LinkManifest.hpp"
#include "types/Item.hpp"
#include "types/VaultPaths.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dredge::storage {
class ItemStore;
}

namespace dredge::link {

// Projects Text items onto the filesystem as symlinks into .spawned/ and
// folds external edits of the spawned files back into the encrypted items.
class LinkManager {
public:
    LinkManager(const types::VaultPaths& paths, storage::ItemStore& store);

    // Throws AlreadyExists (already linked, or target occupied without force),
    // InvalidInput (relative target, non-Text item), IOFailure (missing parent directory).
    // Nothing is left behind on failure.
    void link(const std::string& id, const std::filesystem::path& target, bool force, const std::string& password);

    // With a password and a live item, pending edits are synced first (best effort).
    // Throws NotFound when not linked, NothingToCleanUp when neither symlink nor spawned file existed.
    void unlink(const std::string& id, const std::optional<std::string>& password);

    // Returns true when the spawned file had drifted and was written back into the item
    bool syncIfNeeded(const std::string& id, const std::string& password);

    // Rewrites the spawned file from the item and re-hashes it. No-op when not linked.
    void refresh(const types::Item& item);

    // Manifest lookups, never throw
    [[nodiscard]] bool isLinked(const std::string& id) const;
    [[nodiscard]] std::optional<std::filesystem::path> linkedPath(const std::string& id) const;

    [[nodiscard]] std::vector<std::string> linkedIds() const;
    [[nodiscard]] std::vector<std::string> orphanedLinkIds() const;
    [[nodiscard]] std::vector<std::string> orphanedSpawnedFiles() const;

    // Returns false if it did not exist
    bool removeSpawnedFile(const std::string& id) const;

    [[nodiscard]] const LinkManifest& manifest() const { return manifest_; }

private:
    const types::VaultPaths& paths_;
    storage::ItemStore& store_;
    LinkManifest manifest_;

    void writeSpawnedFile(const std::string& id, const std::string& content) const;
};

}
