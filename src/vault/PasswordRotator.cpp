#include "vault/PasswordRotator.hpp"
#include "auth/PasswordVerifier.hpp"
#include "storage/ItemStore.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

using namespace dredge;
using namespace dredge::vault;
using namespace dredge::log;
namespace fs = std::filesystem;

static void discard(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) Registry::vault()->error("[PasswordRotator] Failed to remove {}: {}", path.string(), ec.message());
}

PasswordRotator::PasswordRotator(const types::VaultPaths& paths, storage::ItemStore& store,
                                 const auth::PasswordVerifier& verifier)
    : PasswordRotator(paths, store, verifier, util::renamePath) {}

PasswordRotator::PasswordRotator(const types::VaultPaths& paths, storage::ItemStore& store,
                                 const auth::PasswordVerifier& verifier, RenameFn rename)
    : paths_(paths), store_(store), verifier_(verifier), rename_(std::move(rename)) {}

size_t PasswordRotator::rotate(const std::string& current, const std::string& next) const {
    if (next.empty()) throw Error(ErrorCode::InvalidInput, "New password cannot be empty");
    if (next == current) throw Error(ErrorCode::InvalidInput, "New password must differ from the current one");

    verifier_.verify(current);

    std::error_code ec;
    if (fs::exists(paths_.itemsOld, ec) || fs::exists(paths_.keyOld, ec))
        throw Error(ErrorCode::InconsistentState,
                    "Backup from an interrupted rotation found in " + paths_.root.string() + ", recover it manually");

    Registry::audit()->info("password rotation started");

    // Read phase: every item must decrypt before anything is written
    std::vector<types::Item> items;
    for (const auto& id : store_.list()) {
        try {
            items.push_back(store_.load(id, current));
        } catch (const Error& e) {
            Registry::vault()->error("[PasswordRotator] Aborting, failed to load {}: {}", id, e.what());
            Registry::audit()->warn("password rotation aborted: item {} unreadable", id);
            throw;
        }
    }

    if (!items.empty()) {
        discard(paths_.itemsTmp);
        try {
            util::ensureDirectory(paths_.itemsTmp);
            for (const auto& item : items)
                util::createExclusive(paths_.itemsTmp / item.id, storage::ItemStore::seal(item, next), util::OWNER_RW);

            if (const auto written = util::countDirectoryEntries(paths_.itemsTmp); written != items.size())
                throw Error(ErrorCode::InconsistentState, "Re-encrypted " + std::to_string(written) +
                                                          " items, expected " + std::to_string(items.size()));
        } catch (const Error& e) {
            Registry::vault()->error("[PasswordRotator] Re-encryption failed, discarding scratch copy: {}", e.what());
            Registry::audit()->warn("password rotation aborted: {}", e.what());
            discard(paths_.itemsTmp);
            throw;
        }

        swapItems();
    }

    try {
        swapKeyFile(next);
    } catch (const Error&) {
        Registry::audit()->error("password rotation failed while replacing the verification file");
        if (!items.empty() && !rollBackItems())
            throw Error(ErrorCode::InconsistentState,
                        "Items are encrypted under the new password but the verification file is not; "
                        "original items are in " + paths_.itemsOld.string());
        throw;
    }

    if (!items.empty()) discard(paths_.itemsOld);
    discard(paths_.keyOld);

    Registry::vault()->info("[PasswordRotator] Re-encrypted {} items under the new password", items.size());
    Registry::audit()->info("password rotation succeeded ({} items)", items.size());
    return items.size();
}

void PasswordRotator::swapItems() const {
    try {
        rename_(paths_.items, paths_.itemsOld);
    } catch (const Error& e) {
        Registry::vault()->error("[PasswordRotator] Could not back up live items: {}", e.what());
        discard(paths_.itemsTmp);
        throw;
    }

    try {
        rename_(paths_.itemsTmp, paths_.items);
    } catch (const Error& e) {
        try {
            rename_(paths_.itemsOld, paths_.items);
        } catch (const Error& restore) {
            Registry::vault()->critical("[PasswordRotator] Swap failed ({}) and restoring {} failed ({}); "
                                        "items remain in {}, manual recovery required",
                                        e.what(), paths_.items.string(), restore.what(), paths_.itemsOld.string());
            throw Error(ErrorCode::InconsistentState,
                        "Password rotation failed and the backup could not be restored; items are in " +
                        paths_.itemsOld.string());
        }
        discard(paths_.itemsTmp);
        Registry::vault()->error("[PasswordRotator] Swap failed, original items restored: {}", e.what());
        throw Error(ErrorCode::InconsistentState,
                    std::string("Password rotation failed during swap, original items restored: ") + e.what());
    }
}

void PasswordRotator::swapKeyFile(const std::string& next) const {
    util::atomicWrite(paths_.keyTmp, auth::PasswordVerifier::seal(next), util::OWNER_RW);

    try {
        rename_(paths_.keyFile, paths_.keyOld);
    } catch (const Error&) {
        util::removeIfExists(paths_.keyTmp);
        throw;
    }

    try {
        rename_(paths_.keyTmp, paths_.keyFile);
    } catch (const Error& e) {
        try {
            rename_(paths_.keyOld, paths_.keyFile);
        } catch (const Error& restore) {
            Registry::vault()->critical("[PasswordRotator] Verification file swap failed ({}) and restoring it failed "
                                        "({}); the old one is {}, manual recovery required",
                                        e.what(), restore.what(), paths_.keyOld.string());
            throw Error(ErrorCode::InconsistentState,
                        "Verification file could not be replaced or restored; the old one is " +
                        paths_.keyOld.string());
        }
        util::removeIfExists(paths_.keyTmp);
        throw Error(ErrorCode::InconsistentState,
                    std::string("Failed to replace the verification file, original restored: ") + e.what());
    }
}

bool PasswordRotator::rollBackItems() const {
    try {
        rename_(paths_.items, paths_.itemsTmp);
        rename_(paths_.itemsOld, paths_.items);
    } catch (const Error& e) {
        Registry::vault()->critical("[PasswordRotator] Could not roll items back after a failed verification file "
                                    "swap ({}); old items are in {}, manual recovery required",
                                    e.what(), paths_.itemsOld.string());
        return false;
    }
    discard(paths_.itemsTmp);
    Registry::vault()->warn("[PasswordRotator] Rolled items back to the original password");
    return true;
}
