#include "SessionOperations.hpp"
#include "../storage/Storage.hpp"
#include <spdlog/spdlog.h>

SessionOperations::SessionOperations(const Session& s, AuthManager& a,
    ProtectedDataStore& d, Clock c)
    : identity(s), auth(a), data(d), clock(std::move(c))
{
}

static std::time_t toTimeT(const Clock& clock) {
    return std::chrono::system_clock::to_time_t(clock());
}

AuthStatus SessionOperations::changeOwnPassword(const std::string& newPassword) {
    spdlog::info("'{}' changing own password", identity.username);
    return auth.setPassword(identity.username, newPassword);
}

AuthStatus SessionOperations::addNote(const std::string& content) {
    if (!Storage::isStorableText(content)) {
        spdlog::warn("Note for '{}' refused: not valid UTF-8", identity.username);
        return AuthStatus::InvalidInput;
    }

    data.appendNote(identity.username, Note(content, toTimeT(clock)));
    spdlog::info("Note added for '{}'", identity.username);
    return AuthStatus::Ok;
}

std::vector<Note> SessionOperations::listNotes() const {
    return data.listNotes(identity.username);
}

AuthStatus SessionOperations::addFile(const std::string& name) {
    if (name.empty()) {
        spdlog::warn("File reference for '{}' refused: empty name", identity.username);
        return AuthStatus::InvalidInput;
    }
    if (!Storage::isStorableText(name)) {
        spdlog::warn("File reference for '{}' refused: name is not valid UTF-8", identity.username);
        return AuthStatus::InvalidInput;
    }

    FileRef ref;
    ref.name = name;
    ref.added_at = toTimeT(clock);
    data.appendFile(identity.username, ref);

    spdlog::info("File reference '{}' added for '{}'", name, identity.username);
    return AuthStatus::Ok;
}

std::vector<FileRef> SessionOperations::listFiles() const {
    return data.listFiles(identity.username);
}

AuthStatus SessionOperations::registerUser(const std::string& username, const std::string& password, Role role) {
    if (!identity.isAdmin()) {
        spdlog::warn("'{}' tried to register '{}' without admin role", identity.username, username);
        return AuthStatus::PermissionDenied;
    }
    return auth.registerUser(username, password, role);
}

AuthStatus SessionOperations::resetOtherPassword(const std::string& target, const std::string& newPassword) {
    if (!identity.isAdmin()) {
        spdlog::warn("'{}' tried to reset the password of '{}' without admin role", identity.username, target);
        return AuthStatus::PermissionDenied;
    }

    spdlog::info("Admin '{}' resetting password of '{}'", identity.username, target);
    return auth.setPassword(target, newPassword);
}

AuthStatus SessionOperations::listUsers(std::vector<std::pair<std::string, Role>>& out) const {
    out.clear();
    if (!identity.isAdmin()) {
        spdlog::warn("'{}' tried to list users without admin role", identity.username);
        return AuthStatus::PermissionDenied;
    }

    for (const auto& [name, user] : auth.loadUsers())
        out.emplace_back(name, user.role);
    return AuthStatus::Ok;
}
