#pragma once

#include "types/VaultPaths.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dredge::auth {

class Session;
class PasswordPrompt;

// Validates passwords against a known-plaintext envelope (.dredge-key)
// without decrypting any item. Never reads or writes the session cache.
class PasswordVerifier {
public:
    static constexpr const auto* KNOWN_PLAINTEXT = "dredge-vault-v1";

    explicit PasswordVerifier(const types::VaultPaths& paths) : paths_(paths) {}

    // False means the vault has not been initialized yet
    [[nodiscard]] bool exists() const;

    // First-run bootstrap. Throws AlreadyExists if a verification file is present.
    void create(const std::string& password) const;

    // Throws NotFound when uninitialized, WrongPassword when decryption fails,
    // Corrupted when it decrypts to something other than the known plaintext.
    void verify(const std::string& password) const;

    // Fresh envelope of the known plaintext, used by password rotation
    [[nodiscard]] static std::vector<uint8_t> seal(const std::string& password);

    // Cached password if it still verifies, otherwise prompt. Bootstraps the
    // verification file on first run and caches the accepted password.
    [[nodiscard]] std::string obtain(Session& session, PasswordPrompt& prompt) const;

private:
    const types::VaultPaths& paths_;
};

}
