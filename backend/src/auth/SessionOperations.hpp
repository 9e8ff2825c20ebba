#pragma once
#include <string>
#include <vector>
#include <utility>
#include "AuthTypes.hpp"
#include "AuthManager.hpp"
#include "../storage/ProtectedDataStore.hpp"
#include "../utils/Clock.hpp"

// Everything a logged-in user can do. Admin-only calls return
// PermissionDenied for ordinary users before touching either store.
class SessionOperations {
public:
    SessionOperations(const Session& session, AuthManager& auth,
        ProtectedDataStore& data, Clock clock = systemClock());

    const Session& session() const { return identity; }

    AuthStatus changeOwnPassword(const std::string& newPassword);

    AuthStatus addNote(const std::string& content);
    std::vector<Note> listNotes() const;

    AuthStatus addFile(const std::string& name);
    std::vector<FileRef> listFiles() const;

    // Admin only
    AuthStatus registerUser(const std::string& username, const std::string& password, Role role);
    AuthStatus resetOtherPassword(const std::string& target, const std::string& newPassword);
    AuthStatus listUsers(std::vector<std::pair<std::string, Role>>& out) const;

private:
    Session identity;
    AuthManager& auth;
    ProtectedDataStore& data;
    Clock clock;
};
