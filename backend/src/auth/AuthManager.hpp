#pragma once

#include <string>
#include "AuthTypes.hpp"
#include "ProtectionTracker.hpp"
#include "../storage/CredentialStore.hpp"
#include "../utils/Config.hpp"
#include "../utils/Clock.hpp"

// Authenticator. Owns the protection tracker; reads and writes users through
// the credential store it is given (which must outlive it).
class AuthManager {
public:
    AuthManager(CredentialStore& store, const AuthConfig& cfg, Clock clock = systemClock());

    // Frozen usernames are rejected before the store is read. Unknown
    // usernames and wrong passwords both yield BadCredential and both count
    // as failures.
    LoginResult login(const std::string& username, const std::string& password);

    bool hasUsers() const;
    bool userExists(const std::string& username) const;
    UserMap loadUsers() const { return users.load(); }

    // Only while no user exists; the first user is always an admin.
    AuthStatus createFirstUser(const std::string& username, const std::string& password);

    // No permission checks here; SessionOperations gates these.
    AuthStatus registerUser(const std::string& username, const std::string& password, Role role);
    AuthStatus setPassword(const std::string& username, const std::string& newPassword);

    ProtectionTracker& tracker() { return protection; }

private:
    CredentialStore& users;
    ProtectionTracker protection;
};
