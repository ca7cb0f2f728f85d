#pragma once

#include "auth/SessionStore.hpp"

#include <optional>
#include <string>

namespace dredge::auth {

// Explicit session handle passed into vault operations. The cached password
// is a convenience only and is always re-verified before it is trusted.
class Session {
public:
    static constexpr const auto* PASSWORD_KEY = "password";
    static constexpr const auto* UNDO_KEY = "undo.json";

    explicit Session(SessionStore& store) : store_(store) {}

    // Throws InvalidInput on an empty password
    void cachePassword(const std::string& password);

    // nullopt when nothing (or an empty value) is cached
    [[nodiscard]] std::optional<std::string> cachedPassword() const;

    void clear();

    [[nodiscard]] bool hasActiveSession() const { return cachedPassword().has_value(); }

    [[nodiscard]] SessionStore& store() const { return store_; }

private:
    SessionStore& store_;
};

}
