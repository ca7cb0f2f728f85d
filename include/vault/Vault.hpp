#pragma once

#include "auth/PasswordVerifier.hpp"
#include "link/LinkManager.hpp"
#include "storage/ItemStore.hpp"
#include "storage/Trash.hpp"
#include "storage/UndoCache.hpp"
#include "types/Item.hpp"
#include "types/VaultPaths.hpp"
#include "util/FileLock.hpp"
#include "vault/SelfHeal.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dredge::auth {
class Session;
class PasswordPrompt;
}

namespace dredge::vault {

// Entry point for the command layer. Write-class operations hold the vault's
// advisory lock for their duration when vault.advisory_lock is enabled.
class Vault {
public:
    Vault(types::VaultPaths paths, auth::Session& session);

    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    // Items
    std::string create(const std::optional<std::string>& id, const types::Item& item, const std::string& password);

    // Reconciles a drifted spawned file into the item before returning it
    [[nodiscard]] types::Item read(const std::string& id, const std::string& password);

    // Never writes anything
    [[nodiscard]] types::Item peek(const std::string& id, const std::string& password) const;

    // Linked items get their spawned file rewritten so the edit does not register as drift
    void update(const std::string& id, const types::Item& item, const std::string& password);

    void remove(const std::string& id);
    [[nodiscard]] bool exists(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> list() const;

    // Links
    void link(const std::string& id, const std::filesystem::path& target, bool force, const std::string& password);
    void unlink(const std::string& id, const std::optional<std::string>& password);
    bool syncIfNeeded(const std::string& id, const std::string& password);
    [[nodiscard]] bool isLinked(const std::string& id) const;
    [[nodiscard]] std::optional<std::filesystem::path> linkedPath(const std::string& id) const;

    // Trash
    void trash(const std::string& id, const std::optional<std::string>& password);
    void restore(const std::string& id);

    // Restores the `count` most recent deletions of this session, all of them when count <= 0.
    // Returns the IDs restored. Throws NotFound when there is nothing to undo.
    std::vector<std::string> undo(int count);

    void rename(const std::string& oldId, const std::string& newId, const std::string& password);

    // Writes a File item's bytes to `output` (or `output`/filename for a directory). Returns bytes written.
    size_t exportFile(const std::string& id, const std::filesystem::path& output, const std::string& password);

    // Captures pending spawned edits, re-encrypts everything, then re-caches the new password
    size_t rotatePassword(const std::string& current, const std::string& next);

    SelfHeal::Report selfHeal();

    // Verified password for this session; the first one obtained in a session triggers self-heal
    std::string obtainPassword(auth::PasswordPrompt& prompt);

    [[nodiscard]] const types::VaultPaths& paths() const { return paths_; }
    [[nodiscard]] link::LinkManager& links() { return links_; }
    [[nodiscard]] const auth::PasswordVerifier& verifier() const { return verifier_; }

private:
    class WriteLock {
    public:
        explicit WriteLock(Vault& vault);
        ~WriteLock();

        WriteLock(const WriteLock&) = delete;
        WriteLock& operator=(const WriteLock&) = delete;

    private:
        Vault& vault_;
    };

    const types::VaultPaths paths_;
    auth::Session& session_;
    storage::ItemStore store_;
    link::LinkManager links_;
    storage::Trash trash_;
    storage::UndoCache undo_;
    auth::PasswordVerifier verifier_;

    bool advisoryLock_;
    unsigned int lockDepth_ = 0;
    std::unique_ptr<util::FileLock> lock_;
};

}
