#include "auth/PasswordVerifier.hpp"
#include "auth/PasswordPrompt.hpp"
#include "auth/Session.hpp"
#include "crypto/util/encrypt.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

using namespace dredge;
using namespace dredge::auth;
using namespace dredge::log;

bool PasswordVerifier::exists() const {
    std::error_code ec;
    return std::filesystem::exists(paths_.keyFile, ec);
}

std::vector<uint8_t> PasswordVerifier::seal(const std::string& password) {
    return crypto::util::encrypt(std::string(KNOWN_PLAINTEXT), password);
}

void PasswordVerifier::create(const std::string& password) const {
    if (password.empty()) throw Error(ErrorCode::InvalidInput, "Password cannot be empty");

    util::ensureDirectory(paths_.root);
    util::createExclusive(paths_.keyFile, seal(password), util::OWNER_RW);

    Registry::auth()->info("[PasswordVerifier] Created verification file {}", paths_.keyFile.string());
    Registry::audit()->info("vault initialized at {}", paths_.root.string());
}

void PasswordVerifier::verify(const std::string& password) const {
    if (password.empty()) throw Error(ErrorCode::InvalidInput, "Password cannot be empty");
    if (!exists())
        throw Error(ErrorCode::NotFound, "Password verification file not found: " + paths_.keyFile.string());

    const auto envelope = util::readFileToVector(paths_.keyFile);

    std::string plaintext;
    try {
        plaintext = crypto::util::decrypt_to_string(envelope, password);
    } catch (const Error& e) {
        if (e.code() != ErrorCode::WrongPassword) throw;
        Registry::auth()->info("[PasswordVerifier] Password rejected");
        throw Error(ErrorCode::WrongPassword, "Wrong password");
    }

    if (plaintext != KNOWN_PLAINTEXT) {
        Registry::auth()->error("[PasswordVerifier] Verification file decrypted to unexpected content");
        throw Error(ErrorCode::Corrupted, "Verification file corrupted: " + paths_.keyFile.string());
    }
}

std::string PasswordVerifier::obtain(Session& session, PasswordPrompt& prompt) const {
    if (const auto cached = session.cachedPassword()) {
        try {
            verify(*cached);
            return *cached;
        } catch (const Error& e) {
            Registry::auth()->warn("[PasswordVerifier] Cached password no longer valid ({}), clearing session",
                                   to_string(e.code()));
            session.clear();
        }
    }

    const auto password = prompt.read("Password: ");
    if (password.empty()) throw Error(ErrorCode::InvalidInput, "Password cannot be empty");

    if (!exists()) create(password);
    else verify(password);

    session.cachePassword(password);
    return password;
}
