#pragma once
#include <string>
#include <optional>
#include "User.hpp"

// Outcomes of core operations. Storage failures are not listed here; they
// arrive as StorageError exceptions.
enum class AuthStatus {
    Ok,
    NotFound,
    AlreadyExists,
    BadCredential,
    Frozen,
    PermissionDenied,
    Expired,
    BadCode,
    SequenceError,
    InvalidInput
};

const char* toString(AuthStatus status);

// Authenticated identity; authorizes SessionOperations.
struct Session {
    std::string username;
    Role role = Role::User;

    bool isAdmin() const { return role == Role::Admin; }
};

struct LoginResult {
    AuthStatus status = AuthStatus::BadCredential;
    std::optional<Session> session;  // set only when status == Ok
    long long remaining_seconds = 0; // set only when status == Frozen

    bool ok() const { return status == AuthStatus::Ok; }
};
