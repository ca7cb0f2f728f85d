#pragma once

#include <filesystem>
#include <string_view>

namespace fs = std::filesystem;

namespace dredge::types {

struct VaultPaths {
    const fs::path dataHome, root, items, spawned, manifest, keyFile, lockFile, trashFiles, trashInfo;

    // Rotation scratch locations, siblings of the live ones so renames stay on one volume
    const fs::path itemsTmp, itemsOld, keyTmp, keyOld;

    explicit VaultPaths(const fs::path& dataHome);

    // Resolves the data home from $XDG_DATA_HOME
    static VaultPaths fromEnvironment();

    [[nodiscard]] fs::path item(std::string_view id) const;
    [[nodiscard]] fs::path spawnedFile(std::string_view id) const;
    [[nodiscard]] fs::path trashedItem(std::string_view id) const;
    [[nodiscard]] fs::path trashInfoFile(std::string_view id) const;

    // Creates the vault root, items and spawn directories (0700) and the trash directories
    void ensureDirectories() const;
};

}
