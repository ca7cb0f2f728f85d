#include "types/Error.hpp"

namespace dredge {

Error::Error(const ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

ErrorCode Error::category() const noexcept {
    switch (code_) {
        case ErrorCode::TooShort: return ErrorCode::Corrupted;
        case ErrorCode::IdExhausted: return ErrorCode::AlreadyExists;
        case ErrorCode::NothingToCleanUp: return ErrorCode::InconsistentState;
        default: return code_;
    }
}

std::string_view to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::AlreadyExists: return "already exists";
        case ErrorCode::WrongPassword: return "wrong password";
        case ErrorCode::Corrupted: return "corrupted";
        case ErrorCode::InvalidInput: return "invalid input";
        case ErrorCode::IOFailure: return "I/O failure";
        case ErrorCode::InconsistentState: return "inconsistent state";
        case ErrorCode::TooShort: return "too short";
        case ErrorCode::IdExhausted: return "ID space exhausted";
        case ErrorCode::NothingToCleanUp: return "nothing to clean up";
        default: return "unknown";
    }
}

}
