#pragma once

#include "auth/SessionStore.hpp"

#include <string>
#include <vector>

namespace dredge::storage {

// Recently trashed IDs for this session, most recent first, as a JSON array
class UndoCache {
public:
    UndoCache(auth::SessionStore& store, unsigned int capacity);

    void push(const std::string& id);

    // Throws Corrupted if the stored list is not a JSON array of strings
    [[nodiscard]] std::vector<std::string> ids() const;

    // An empty list clears the cache
    void replace(const std::vector<std::string>& ids);
    void clear();

private:
    auth::SessionStore& store_;
    unsigned int capacity_;
};

}
