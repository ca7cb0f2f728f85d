#pragma once

#include "types/VaultPaths.hpp"

#include <string>
#include <vector>

namespace dredge::storage {

// Soft delete into the freedesktop trash: Trash/files/dredge-<id> plus a .trashinfo sidecar
class Trash {
public:
    explicit Trash(const types::VaultPaths& paths) : paths_(paths) {}

    // Throws NotFound if the item does not exist. A previously trashed copy with the same ID is replaced.
    void moveToTrash(const std::string& id) const;

    // Throws NotFound if not in the trash, AlreadyExists if a live item has the ID
    void restore(const std::string& id) const;

    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> list() const;

private:
    const types::VaultPaths& paths_;
};

}
