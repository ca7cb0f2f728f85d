#pragma once

#include <string>

namespace dredge::auth {

class PasswordPrompt {
public:
    virtual ~PasswordPrompt() = default;

    // Returns the entered password; may be empty
    virtual std::string read(const std::string& message) = 0;
};

// Reads from the controlling terminal with echo disabled
class TerminalPrompt final : public PasswordPrompt {
public:
    std::string read(const std::string& message) override;
};

}
