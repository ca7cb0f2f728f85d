#include "auth/Session.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

using namespace dredge;
using namespace dredge::auth;

void Session::cachePassword(const std::string& password) {
    if (password.empty()) throw Error(ErrorCode::InvalidInput, "Cannot cache an empty password");
    store_.put(PASSWORD_KEY, password);
    log::Registry::auth()->debug("[Session] Password cached for this session");
}

std::optional<std::string> Session::cachedPassword() const {
    auto pw = store_.get(PASSWORD_KEY);
    if (!pw || pw->empty()) return std::nullopt;
    return pw;
}

void Session::clear() {
    store_.erase(PASSWORD_KEY);
    log::Registry::auth()->debug("[Session] Session password cleared");
}
