#include "types/VaultPaths.hpp"
#include "config/paths.hpp"
#include "util/files.hpp"

namespace dredge::types {

static constexpr std::string_view TRASH_PREFIX = "dredge-";

VaultPaths::VaultPaths(const fs::path& dataHome)
    : dataHome(dataHome),
      root(dataHome / paths::APP_NAME),
      items(root / "items"),
      spawned(root / ".spawned"),
      manifest(root / "links.json"),
      keyFile(root / ".dredge-key"),
      lockFile(root / ".lock"),
      trashFiles(dataHome / "Trash" / "files"),
      trashInfo(dataHome / "Trash" / "info"),
      itemsTmp(root / "items.tmp"),
      itemsOld(root / "items.old"),
      keyTmp(root / ".dredge-key.tmp"),
      keyOld(root / ".dredge-key.old") {}

VaultPaths VaultPaths::fromEnvironment() { return VaultPaths(paths::getDataHome()); }

fs::path VaultPaths::item(const std::string_view id) const { return items / id; }

fs::path VaultPaths::spawnedFile(const std::string_view id) const { return spawned / id; }

fs::path VaultPaths::trashedItem(const std::string_view id) const {
    return trashFiles / (std::string(TRASH_PREFIX) + std::string(id));
}

fs::path VaultPaths::trashInfoFile(const std::string_view id) const {
    return trashInfo / (std::string(TRASH_PREFIX) + std::string(id) + ".trashinfo");
}

void VaultPaths::ensureDirectories() const {
    util::ensureDirectory(root);
    util::ensureDirectory(items);
    util::ensureDirectory(spawned);
    util::ensureSharedDirectory(trashFiles);
    util::ensureSharedDirectory(trashInfo);
}

}
