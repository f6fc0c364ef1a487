//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures and the value-or-error result used by every public AIQ auth operation
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace aiq {
namespace errors {

// Failure taxonomy. Every kind is terminal for the current call.
enum class ErrorCategory {
    InvalidInput,            // blank parameter or value that cannot form a valid URI; no I/O attempted
    TransportFailure,        // request could not be completed (resolve/connect/TLS/read/timeout)
    AuthenticationRejected,  // service answered with a non-200 status
    MalformedResponse        // body not JSON, required field absent or of wrong type, or empty
};

// Typed error representation used by the library.
struct AuthError {
    ErrorCategory category{ErrorCategory::InvalidInput};
    std::string message;
    int httpStatus{0}; // set for AuthenticationRejected only
};

//==========================================================================================================
// Result
// Purpose: Carries either a value or an AuthError, never both.
// Methods:
//   IsError(): True when error is present.
//   Value()/Error(): Accessors; callers check IsError() first.
//==========================================================================================================
template <typename T>
class Result {
public:
    std::optional<T> value;
    std::optional<AuthError> error;

    static Result Ok(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result Fail(AuthError e) {
        Result r;
        r.error = std::move(e);
        return r;
    }

    static Result Fail(ErrorCategory category, std::string message, int httpStatus = 0) {
        return Fail(AuthError{category, std::move(message), httpStatus});
    }

    bool IsError() const { return error.has_value(); }

    const T& Value() const { return value.value(); }
    T& Value() { return value.value(); }
    const AuthError& Error() const { return error.value(); }
};

// Map a category to a stable diagnostic name, e.g. "InvalidInput".
inline const char* CategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::InvalidInput: return "InvalidInput";
        case ErrorCategory::TransportFailure: return "TransportFailure";
        case ErrorCategory::AuthenticationRejected: return "AuthenticationRejected";
        case ErrorCategory::MalformedResponse: return "MalformedResponse";
    }
    return "Unknown";
}

// Shorthand for the "Invalid <what>" validation failure.
inline AuthError InvalidInput(const std::string& what) {
    return AuthError{ErrorCategory::InvalidInput, std::string("Invalid ") + what, 0};
}

//==========================================================================================================
// Describe
// Purpose: Renders an error for logs and CLI output.
// Returns:
//   For AuthenticationRejected: "Failed to authenticate, the status code is [N] and error message is [M]".
//   Otherwise: "<Category>: <message>".
//==========================================================================================================
inline std::string Describe(const AuthError& err) {
    if (err.category == ErrorCategory::AuthenticationRejected) {
        return std::string("Failed to authenticate, the status code is [") + std::to_string(err.httpStatus) +
               std::string("] and error message is [") + err.message + std::string("]");
    }
    return std::string(CategoryName(err.category)) + std::string(": ") + err.message;
}

} // namespace errors
} // namespace aiq
