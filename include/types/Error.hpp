#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace dredge {

enum class ErrorCode {
    NotFound,
    AlreadyExists,
    WrongPassword,
    Corrupted,
    InvalidInput,
    IOFailure,
    InconsistentState,

    // Finer-grained codes, each belonging to one of the classes above
    TooShort,          // Corrupted
    IdExhausted,       // AlreadyExists
    NothingToCleanUp   // InconsistentState
};

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    // Collapses the fine-grained codes onto the seven top-level classes
    [[nodiscard]] ErrorCode category() const noexcept;

private:
    ErrorCode code_;
};

std::string_view to_string(ErrorCode code);

}
