#include "vault/Vault.hpp"
#include "vault/PasswordRotator.hpp"
#include "auth/PasswordPrompt.hpp"
#include "auth/Session.hpp"
#include "config/ConfigRegistry.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace dredge;
using namespace dredge::vault;
using namespace dredge::types;
using namespace dredge::log;
namespace fs = std::filesystem;

Vault::WriteLock::WriteLock(Vault& vault) : vault_(vault) {
    if (vault_.lockDepth_ == 0 && vault_.advisoryLock_) {
        util::ensureDirectory(vault_.paths_.root);
        vault_.lock_ = std::make_unique<util::FileLock>(vault_.paths_.lockFile);
    }
    ++vault_.lockDepth_;
}

Vault::WriteLock::~WriteLock() {
    if (--vault_.lockDepth_ == 0) vault_.lock_.reset();
}

Vault::Vault(VaultPaths paths, auth::Session& session)
    : paths_(std::move(paths)),
      session_(session),
      store_(paths_),
      links_(paths_, store_),
      trash_(paths_),
      undo_(session.store(), config::ConfigRegistry::get().vault.undo_history),
      verifier_(paths_),
      advisoryLock_(config::ConfigRegistry::get().vault.advisory_lock) {}

std::string Vault::create(const std::optional<std::string>& id, const Item& item, const std::string& password) {
    WriteLock lock(*this);
    return store_.create(id, item, password);
}

Item Vault::read(const std::string& id, const std::string& password) {
    if (store_.exists(id) && links_.isLinked(id)) {
        WriteLock lock(*this);
        links_.syncIfNeeded(id, password);
    }
    return store_.load(id, password);
}

Item Vault::peek(const std::string& id, const std::string& password) const {
    return store_.load(id, password);
}

void Vault::update(const std::string& id, const Item& item, const std::string& password) {
    WriteLock lock(*this);

    const bool linked = links_.isLinked(id);
    if (linked && !item.isText())
        throw Error(ErrorCode::InvalidInput, "Linked item " + id + " must stay a text item");

    Item updated = item;
    updated.id = id;
    store_.update(id, updated, password);

    if (linked) links_.refresh(updated);
}

void Vault::remove(const std::string& id) {
    WriteLock lock(*this);
    if (!store_.exists(id)) throw Error(ErrorCode::NotFound, "Item '" + id + "' not found");

    if (links_.isLinked(id)) {
        try {
            links_.unlink(id, std::nullopt);
        } catch (const Error& e) {
            if (e.code() != ErrorCode::NothingToCleanUp) throw;
            Registry::vault()->debug("[Vault] Link of {} was already gone", id);
        }
    }

    store_.remove(id);
}

bool Vault::exists(const std::string& id) const { return store_.exists(id); }

std::vector<std::string> Vault::list() const { return store_.list(); }

void Vault::link(const std::string& id, const fs::path& target, const bool force, const std::string& password) {
    WriteLock lock(*this);
    links_.link(id, target, force, password);
}

void Vault::unlink(const std::string& id, const std::optional<std::string>& password) {
    WriteLock lock(*this);
    links_.unlink(id, password);
}

bool Vault::syncIfNeeded(const std::string& id, const std::string& password) {
    WriteLock lock(*this);
    return links_.syncIfNeeded(id, password);
}

bool Vault::isLinked(const std::string& id) const { return links_.isLinked(id); }

std::optional<fs::path> Vault::linkedPath(const std::string& id) const { return links_.linkedPath(id); }

void Vault::trash(const std::string& id, const std::optional<std::string>& password) {
    WriteLock lock(*this);
    if (!store_.exists(id)) throw Error(ErrorCode::NotFound, "Item '" + id + "' not found");

    if (links_.isLinked(id)) {
        try {
            links_.unlink(id, password);
        } catch (const Error& e) {
            if (e.code() != ErrorCode::NothingToCleanUp) throw;
            Registry::vault()->debug("[Vault] Link of {} was already gone", id);
        }
    }

    trash_.moveToTrash(id);
    undo_.push(id);
}

void Vault::restore(const std::string& id) {
    WriteLock lock(*this);
    trash_.restore(id);

    auto pending = undo_.ids();
    if (std::erase(pending, id) > 0) undo_.replace(pending);
}

std::vector<std::string> Vault::undo(const int count) {
    WriteLock lock(*this);

    const auto cached = undo_.ids();
    if (cached.empty()) throw Error(ErrorCode::NotFound, "Nothing to undo");

    const size_t n = count <= 0 ? cached.size() : std::min(static_cast<size_t>(count), cached.size());

    std::vector<std::string> restored, pending;
    for (size_t i = 0; i < n; ++i) {
        try {
            trash_.restore(cached[i]);
            restored.push_back(cached[i]);
        } catch (const Error& e) {
            Registry::vault()->warn("[Vault] Failed to restore {}: {}", cached[i], e.what());
            pending.push_back(cached[i]);
        }
    }
    pending.insert(pending.end(), cached.begin() + static_cast<std::ptrdiff_t>(n), cached.end());

    undo_.replace(pending);
    return restored;
}

void Vault::rename(const std::string& oldId, const std::string& newId, const std::string& password) {
    WriteLock lock(*this);

    validateId(newId);
    if (!store_.exists(oldId)) throw Error(ErrorCode::NotFound, "Item '" + oldId + "' not found");
    if (store_.exists(newId)) throw Error(ErrorCode::AlreadyExists, "Item '" + newId + "' already exists");

    const auto target = links_.linkedPath(oldId);
    if (target) {
        try {
            links_.unlink(oldId, password);
        } catch (const Error& e) {
            if (e.code() != ErrorCode::NothingToCleanUp) throw;
        }
    }

    store_.rename(oldId, newId);

    if (!target) return;

    try {
        links_.link(newId, *target, true, password);
    } catch (const Error& e) {
        Registry::vault()->error("[Vault] Relinking {} at {} failed, rolling back rename: {}",
                                 newId, target->string(), e.what());
        store_.rename(newId, oldId);
        try {
            links_.link(oldId, *target, true, password);
        } catch (const Error& relink) {
            Registry::vault()->error("[Vault] Could not restore link of {}: {}", oldId, relink.what());
        }
        throw;
    }
}

size_t Vault::exportFile(const std::string& id, const fs::path& output, const std::string& password) {
    const auto item = store_.load(id, password);
    if (item.isText()) throw Error(ErrorCode::InvalidInput, "Item " + id + " is a text item, nothing to export");

    auto path = output;
    std::error_code ec;
    if (fs::is_directory(path, ec)) path /= fs::path(item.filename.value_or(id)).filename();
    if (fs::exists(fs::symlink_status(path, ec))) throw Error(ErrorCode::AlreadyExists, "File already exists: " + path.string());

    const auto bytes = decodeFileContent(item);
    util::createExclusive(path, bytes, util::OWNER_RW | fs::perms::group_read | fs::perms::others_read);

    Registry::vault()->info("[Vault] Exported {} to {}", id, path.string());
    return bytes.size();
}

size_t Vault::rotatePassword(const std::string& current, const std::string& next) {
    WriteLock lock(*this);

    verifier_.verify(current);

    // External edits must land in the items before they are re-encrypted
    for (const auto& id : links_.linkedIds())
        if (store_.exists(id)) links_.syncIfNeeded(id, current);

    const size_t rotated = PasswordRotator(paths_, store_, verifier_).rotate(current, next);
    session_.cachePassword(next);
    return rotated;
}

SelfHeal::Report Vault::selfHeal() {
    WriteLock lock(*this);
    return SelfHeal(links_).run();
}

std::string Vault::obtainPassword(auth::PasswordPrompt& prompt) {
    const bool newSession = !session_.hasActiveSession();
    auto password = verifier_.obtain(session_, prompt);

    if (newSession) {
        try {
            if (const auto report = selfHeal(); !report.empty())
                Registry::vault()->info("[Vault] Self-heal removed {} orphaned links and {} orphaned spawned files",
                                        report.unlinked.size(), report.removedSpawned.size());
        } catch (const Error& e) {
            Registry::vault()->warn("[Vault] Self-heal failed: {}", e.what());
        }
    }

    return password;
}
