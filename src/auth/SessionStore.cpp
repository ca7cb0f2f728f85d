#include "auth/SessionStore.hpp"
#include "config/ConfigRegistry.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <unistd.h>

using namespace dredge::auth;
using namespace dredge::log;
namespace fs = std::filesystem;

FileSessionStore::FileSessionStore(const fs::path& root) : FileSessionStore(root, getppid()) {}

FileSessionStore::FileSessionStore(const fs::path& root, const pid_t owner)
    : root_(root), dir_(root / std::to_string(owner)) {}

FileSessionStore FileSessionStore::forParentProcess() {
    return FileSessionStore(config::ConfigRegistry::get().sessionRoot());
}

fs::path FileSessionStore::entryPath(const std::string& key) const {
    if (key.empty() || key.find('/') != std::string::npos || key == "." || key == "..")
        throw std::invalid_argument("Invalid session key: " + key);
    return dir_ / key;
}

std::optional<std::string> FileSessionStore::get(const std::string& key) const {
    const auto path = entryPath(key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;
    return util::readFileToString(path);
}

void FileSessionStore::put(const std::string& key, const std::string& value) {
    const auto path = entryPath(key);
    util::ensureDirectory(root_);
    util::ensureDirectory(dir_);
    util::atomicWrite(path, value, util::OWNER_RW);
    Registry::auth()->debug("[FileSessionStore] Stored session entry '{}' in {}", key, dir_.string());
}

void FileSessionStore::erase(const std::string& key) {
    if (util::removeIfExists(entryPath(key)))
        Registry::auth()->debug("[FileSessionStore] Removed session entry '{}' from {}", key, dir_.string());

    // The per-process directory goes away with its last entry
    std::error_code ec;
    if (fs::is_directory(dir_, ec) && fs::is_empty(dir_, ec)) fs::remove(dir_, ec);
}

std::optional<std::string> MemorySessionStore::get(const std::string& key) const {
    if (const auto it = entries_.find(key); it != entries_.end()) return it->second;
    return std::nullopt;
}

void MemorySessionStore::put(const std::string& key, const std::string& value) { entries_[key] = value; }

void MemorySessionStore::erase(const std::string& key) { entries_.erase(key); }
