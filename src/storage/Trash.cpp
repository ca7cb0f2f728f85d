#include "storage/Trash.hpp"
#include "types/Error.hpp"
#include "types/Item.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace dredge;
using namespace dredge::storage;
using namespace dredge::log;
namespace fs = std::filesystem;

static constexpr std::string_view TRASH_PREFIX = "dredge-";

void Trash::moveToTrash(const std::string& id) const {
    types::validateId(id);
    const auto itemPath = paths_.item(id);

    std::error_code ec;
    if (!fs::is_regular_file(itemPath, ec)) throw Error(ErrorCode::NotFound, "Item '" + id + "' not found");

    util::ensureSharedDirectory(paths_.trashFiles);
    util::ensureSharedDirectory(paths_.trashInfo);

    const auto trashed = paths_.trashedItem(id);
    util::renamePath(itemPath, trashed);

    const std::string info = "[Trash Info]\nPath=" + itemPath.string() +
                             "\nDeletionDate=" + util::timestampToString(util::now()) + "\n";
    try {
        util::atomicWrite(paths_.trashInfoFile(id), info, util::OWNER_RW);
    } catch (const Error&) {
        Registry::storage()->error("[Trash] Failed to write trash info for {}, moving it back", id);
        util::renamePath(trashed, itemPath);
        throw;
    }

    Registry::storage()->info("[Trash] Moved item {} to trash", id);
    Registry::audit()->info("item trashed: {}", id);
}

void Trash::restore(const std::string& id) const {
    types::validateId(id);
    if (!contains(id)) throw Error(ErrorCode::NotFound, "Item '" + id + "' not found in trash");

    std::error_code ec;
    if (fs::exists(paths_.item(id), ec))
        throw Error(ErrorCode::AlreadyExists, "Item '" + id + "' already exists in the vault");

    util::ensureDirectory(paths_.items);
    util::moveNoReplace(paths_.trashedItem(id), paths_.item(id));

    try {
        util::removeIfExists(paths_.trashInfoFile(id));
    } catch (const Error& e) {
        Registry::storage()->warn("[Trash] Restored {} but failed to remove its trash info: {}", id, e.what());
    }

    Registry::storage()->info("[Trash] Restored item {}", id);
    Registry::audit()->info("item restored: {}", id);
}

bool Trash::contains(const std::string& id) const {
    if (!types::isValidId(id)) return false;
    std::error_code ec;
    return fs::is_regular_file(paths_.trashedItem(id), ec);
}

std::vector<std::string> Trash::list() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(paths_.trashFiles, ec)) return ids;

    for (fs::directory_iterator it(paths_.trashFiles, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (!name.starts_with(TRASH_PREFIX)) continue;
        if (auto id = name.substr(TRASH_PREFIX.size()); types::isValidId(id)) ids.push_back(std::move(id));
    }
    if (ec) throw Error(ErrorCode::IOFailure, "Failed to list " + paths_.trashFiles.string() + ": " + ec.message());

    std::ranges::sort(ids);
    return ids;
}
