#pragma once

#include "types/VaultPaths.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace dredge::auth {
class PasswordVerifier;
}

namespace dredge::storage {
class ItemStore;
}

namespace dredge::vault {

// Re-encrypts every item under a new password in a scratch directory, then
// swaps it in with two renames. Before the swap the live vault is never touched.
class PasswordRotator {
public:
    using RenameFn = std::function<void(const std::filesystem::path& from, const std::filesystem::path& to)>;

    PasswordRotator(const types::VaultPaths& paths, storage::ItemStore& store, const auth::PasswordVerifier& verifier);

    // Rename hook for the swap steps
    PasswordRotator(const types::VaultPaths& paths, storage::ItemStore& store, const auth::PasswordVerifier& verifier,
                    RenameFn rename);

    // Throws InvalidInput when the passwords are equal, WrongPassword when current does not verify,
    // and InconsistentState when the swap could not complete. Returns the number of items re-encrypted.
    size_t rotate(const std::string& current, const std::string& next) const;

private:
    const types::VaultPaths& paths_;
    storage::ItemStore& store_;
    const auth::PasswordVerifier& verifier_;
    RenameFn rename_;

    void swapItems() const;
    void swapKeyFile(const std::string& next) const;

    // Puts the original items back after the verification file could not be replaced
    bool rollBackItems() const;
};

}
