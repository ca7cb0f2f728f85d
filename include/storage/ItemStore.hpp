#pragma once

#include "types/Item.hpp"
#include "types/VaultPaths.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dredge::storage {

// One encrypted file per item under items/, named by ID. Never consults links:
// reconciliation with spawned files happens a layer above.
class ItemStore {
public:
    using IdSource = std::function<std::string()>;

    // IDs from crypto::IdGenerator, length and attempts from the vault config
    explicit ItemStore(const types::VaultPaths& paths);
    ItemStore(const types::VaultPaths& paths, IdSource idSource, unsigned int maxAttempts);

    // Generates a random ID when none is supplied, retrying collisions.
    // Throws AlreadyExists for an occupied explicit ID, IdExhausted when every attempt collides.
    std::string create(const std::optional<std::string>& id, types::Item item, const std::string& password);

    // Pure read: decrypt and decode, no side effects
    [[nodiscard]] types::Item load(const std::string& id, const std::string& password) const;

    // Bumps modified and rewrites the record
    void update(const std::string& id, types::Item item, const std::string& password);

    // Rewrites the record as given, timestamps untouched
    void store(const types::Item& item, const std::string& password);

    void remove(const std::string& id);
    [[nodiscard]] bool exists(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> list() const;

    // Throws NotFound, AlreadyExists, or InvalidInput for a malformed new ID
    void rename(const std::string& oldId, const std::string& newId);

    [[nodiscard]] static std::vector<uint8_t> seal(const types::Item& item, const std::string& password);
    [[nodiscard]] static types::Item open(const std::vector<uint8_t>& envelope, const std::string& id,
                                          const std::string& password);

    [[nodiscard]] const types::VaultPaths& paths() const { return paths_; }

private:
    const types::VaultPaths& paths_;
    IdSource idSource_;
    unsigned int maxAttempts_;

    void requireExisting(const std::string& id) const;
};

}
