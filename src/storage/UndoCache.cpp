#include "storage/UndoCache.hpp"
#include "auth/Session.hpp"
#include "types/Error.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>

using namespace dredge;
using namespace dredge::storage;
using json = nlohmann::json;

UndoCache::UndoCache(auth::SessionStore& store, const unsigned int capacity)
    : store_(store), capacity_(capacity == 0 ? 1 : capacity) {}

void UndoCache::push(const std::string& id) {
    auto list = ids();
    std::erase(list, id);
    list.insert(list.begin(), id);
    if (list.size() > capacity_) list.resize(capacity_);
    replace(list);
}

std::vector<std::string> UndoCache::ids() const {
    const auto raw = store_.get(auth::Session::UNDO_KEY);
    if (!raw) return {};

    try {
        return json::parse(*raw).get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        throw Error(ErrorCode::Corrupted, std::string("Invalid undo cache: ") + e.what());
    }
}

void UndoCache::replace(const std::vector<std::string>& ids) {
    if (ids.empty()) {
        clear();
        return;
    }
    store_.put(auth::Session::UNDO_KEY, json(ids).dump());
}

void UndoCache::clear() { store_.erase(auth::Session::UNDO_KEY); }
