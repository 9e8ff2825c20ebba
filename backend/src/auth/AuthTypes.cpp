#include "AuthTypes.hpp"

const char* toString(AuthStatus status) {
    switch (status) {
    case AuthStatus::Ok: return "ok";
    case AuthStatus::NotFound: return "not found";
    case AuthStatus::AlreadyExists: return "already exists";
    case AuthStatus::BadCredential: return "bad credential";
    case AuthStatus::Frozen: return "frozen";
    case AuthStatus::PermissionDenied: return "permission denied";
    case AuthStatus::Expired: return "expired";
    case AuthStatus::BadCode: return "bad code";
    case AuthStatus::SequenceError: return "sequence error";
    case AuthStatus::InvalidInput: return "invalid input";
    }
    return "unknown";
}
