#include "storage/ItemStore.hpp"
#include "storage/ItemCodec.hpp"
#include "config/ConfigRegistry.hpp"
#include "crypto/IdGenerator.hpp"
#include "crypto/util/encrypt.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace dredge;
using namespace dredge::storage;
using namespace dredge::types;
using namespace dredge::log;

static ItemStore::IdSource defaultIdSource() {
    crypto::IdGenerator gen({ .length = config::ConfigRegistry::get().vault.id_length });
    return [gen] { return gen.generate(); };
}

ItemStore::ItemStore(const VaultPaths& paths)
    : ItemStore(paths, defaultIdSource(), config::ConfigRegistry::get().vault.id_max_attempts) {}

ItemStore::ItemStore(const VaultPaths& paths, IdSource idSource, const unsigned int maxAttempts)
    : paths_(paths), idSource_(std::move(idSource)), maxAttempts_(maxAttempts) {
    if (!idSource_) throw std::invalid_argument("ItemStore requires an ID source");
    if (maxAttempts_ == 0) throw std::invalid_argument("ItemStore requires at least one ID attempt");
}

std::vector<uint8_t> ItemStore::seal(const Item& item, const std::string& password) {
    return crypto::util::encrypt(codec::encode(item), password);
}

Item ItemStore::open(const std::vector<uint8_t>& envelope, const std::string& id, const std::string& password) {
    return codec::decode(crypto::util::decrypt_to_string(envelope, password), id);
}

std::string ItemStore::create(const std::optional<std::string>& id, Item item, const std::string& password) {
    if (item.created == 0) item.created = util::now();
    if (item.modified == 0) item.modified = item.created;
    validate(item);

    util::ensureDirectory(paths_.items);

    if (id) {
        validateId(*id);
        item.id = *id;
        util::createExclusive(paths_.item(*id), seal(item, password), util::OWNER_RW);
        Registry::storage()->debug("[ItemStore] Created item {}", *id);
        Registry::audit()->info("item created: {}", *id);
        return *id;
    }

    for (unsigned int attempt = 1; attempt <= maxAttempts_; ++attempt) {
        const auto candidate = idSource_();
        validateId(candidate);
        if (exists(candidate)) {
            Registry::storage()->debug("[ItemStore] ID collision on attempt {}: {}", attempt, candidate);
            continue;
        }

        item.id = candidate;
        try {
            util::createExclusive(paths_.item(candidate), seal(item, password), util::OWNER_RW);
        } catch (const Error& e) {
            if (e.code() != ErrorCode::AlreadyExists) throw;
            continue;   // lost a race for this ID
        }

        Registry::storage()->debug("[ItemStore] Created item {}", candidate);
        Registry::audit()->info("item created: {}", candidate);
        return candidate;
    }

    Registry::storage()->error("[ItemStore] Failed to generate a unique ID after {} attempts", maxAttempts_);
    throw Error(ErrorCode::IdExhausted,
                "Failed to generate a unique ID after " + std::to_string(maxAttempts_) + " attempts");
}

Item ItemStore::load(const std::string& id, const std::string& password) const {
    requireExisting(id);
    return open(util::readFileToVector(paths_.item(id)), id, password);
}

void ItemStore::update(const std::string& id, Item item, const std::string& password) {
    item.id = id;
    item.touch();
    store(item, password);
}

void ItemStore::store(const Item& item, const std::string& password) {
    requireExisting(item.id);
    validate(item);
    util::atomicWrite(paths_.item(item.id), seal(item, password), util::OWNER_RW);
    Registry::storage()->debug("[ItemStore] Wrote item {}", item.id);
}

void ItemStore::remove(const std::string& id) {
    validateId(id);
    if (!util::removeIfExists(paths_.item(id)))
        throw Error(ErrorCode::NotFound, "Item '" + id + "' not found");
    Registry::storage()->info("[ItemStore] Deleted item {}", id);
    Registry::audit()->info("item deleted: {}", id);
}

bool ItemStore::exists(const std::string& id) const {
    if (!isValidId(id)) return false;
    std::error_code ec;
    return std::filesystem::is_regular_file(paths_.item(id), ec);
}

std::vector<std::string> ItemStore::list() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!std::filesystem::is_directory(paths_.items, ec)) return ids;

    for (std::filesystem::directory_iterator it(paths_.items, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (it->is_regular_file(ec) && isValidId(name)) ids.push_back(name);
    }
    if (ec) throw Error(ErrorCode::IOFailure, "Failed to list " + paths_.items.string() + ": " + ec.message());

    std::ranges::sort(ids);
    return ids;
}

void ItemStore::rename(const std::string& oldId, const std::string& newId) {
    validateId(newId);
    requireExisting(oldId);
    if (exists(newId)) throw Error(ErrorCode::AlreadyExists, "Item '" + newId + "' already exists");

    util::moveNoReplace(paths_.item(oldId), paths_.item(newId));
    Registry::storage()->info("[ItemStore] Renamed item {} -> {}", oldId, newId);
    Registry::audit()->info("item renamed: {} -> {}", oldId, newId);
}

void ItemStore::requireExisting(const std::string& id) const {
    validateId(id);
    if (!exists(id)) throw Error(ErrorCode::NotFound, "Item '" + id + "' not found");
}
