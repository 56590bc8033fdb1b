#ifndef DBRIDGE_SESSION_ERROR_HPP
#define DBRIDGE_SESSION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dbridge {
namespace session {

class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& message)
        : std::runtime_error(message) {}
};

// Credential exchange failed: transport error, rejected credentials or no token
class AuthError : public SessionError {
public:
    explicit AuthError(const std::string& message)
        : SessionError("Authentication failed: " + message) {}
};

class NotAuthenticatedError : public SessionError {
public:
    NotAuthenticatedError()
        : SessionError("Not authenticated, call authenticate() first") {}
};

class TokenExpiredError : public SessionError {
public:
    TokenExpiredError()
        : SessionError("Authentication token has expired, authenticate again") {}
};

// Non-throwing result of an authentication check
enum class AuthStatus {
    OK = 0,
    NOT_AUTHENTICATED,
    TOKEN_EXPIRED
};

inline const char* auth_status_to_string(AuthStatus status) {
    switch (status) {
        case AuthStatus::OK: return "OK";
        case AuthStatus::NOT_AUTHENTICATED: return "Not authenticated";
        case AuthStatus::TOKEN_EXPIRED: return "Token expired";
        default: return "Undefined status";
    }
}

} // namespace session
} // namespace dbridge

#endif // DBRIDGE_SESSION_ERROR_HPP
