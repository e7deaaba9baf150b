#pragma once

#include <stdexcept>
#include <string>

namespace scapula {

/**
 * Failure categories reported by the registration engine.
 */
enum class ErrorCode {
    EmptyReferenceSet,
    InsufficientCorrespondences,
    EmptyCollection,
    NumericDegeneracy
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::EmptyReferenceSet: return "EmptyReferenceSet";
        case ErrorCode::InsufficientCorrespondences: return "InsufficientCorrespondences";
        case ErrorCode::EmptyCollection: return "EmptyCollection";
        case ErrorCode::NumericDegeneracy: return "NumericDegeneracy";
    }
    return "Unknown";
}


/**
 * Exception thrown by the registration engine.
 * what() is prefixed with the error code name.
 */
class RegistrationError : public std::runtime_error {
public:
    RegistrationError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(to_string(code)) + ": " + message)
        , code_(code)
        , message_(message) {}

    ErrorCode code() const { return code_; }

    // what() without the code prefix
    const std::string& message() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace scapula
