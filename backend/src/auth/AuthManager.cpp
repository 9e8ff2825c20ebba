#include "AuthManager.hpp"
#include "PasswordHasher.hpp"
#include "../storage/Storage.hpp"
#include <spdlog/spdlog.h>

AuthManager::AuthManager(CredentialStore& store, const AuthConfig& cfg, Clock clock)
    : users(store),
    protection(cfg.max_attempts, std::chrono::seconds(cfg.freeze_seconds), std::move(clock))
{
    spdlog::info("AuthManager initialized (max_attempts={}, freeze={}s)",
        cfg.max_attempts, cfg.freeze_seconds);
}

LoginResult AuthManager::login(const std::string& username, const std::string& password) {
    spdlog::info("Login attempt for username '{}'", username);

    LoginResult result;

    ProtectionStatus status = protection.checkStatus(username);
    if (status.frozen) {
        spdlog::warn("Login rejected: '{}' is frozen for {} more seconds", username, status.remaining_seconds);
        result.status = AuthStatus::Frozen;
        result.remaining_seconds = status.remaining_seconds;
        return result;
    }

    auto user = users.find(username);
    if (user && PasswordHasher::matches(password, user->password_hash)) {
        protection.recordSuccess(username);
        result.status = AuthStatus::Ok;
        result.session = Session{ user->username, user->role };
        spdlog::info("User '{}' logged in as {}", username, roleToString(user->role));
        return result;
    }

    if (!user)
        spdlog::debug("Login failed: username '{}' not found", username);
    else
        spdlog::debug("Login failed: incorrect password for '{}'", username);

    status = protection.recordFailure(username);
    if (status.frozen) {
        result.status = AuthStatus::Frozen;
        result.remaining_seconds = status.remaining_seconds;
        return result;
    }

    result.status = AuthStatus::BadCredential;
    return result;
}

bool AuthManager::hasUsers() const {
    return !users.empty();
}

bool AuthManager::userExists(const std::string& username) const {
    return users.find(username).has_value();
}

AuthStatus AuthManager::createFirstUser(const std::string& username, const std::string& password) {
    if (hasUsers()) {
        spdlog::warn("createFirstUser('{}') refused: users already exist", username);
        return AuthStatus::PermissionDenied;
    }

    spdlog::info("Creating first user '{}' as admin", username);
    return registerUser(username, password, Role::Admin);
}

AuthStatus AuthManager::registerUser(const std::string& username, const std::string& password, Role role) {
    spdlog::info("Attempting registration for username '{}'", username);

    if (username.empty() || password.empty()) {
        spdlog::warn("Registration failed: empty username or password");
        return AuthStatus::InvalidInput;
    }

    if (!Storage::isStorableText(username)) {
        spdlog::warn("Registration failed: username is not valid UTF-8");
        return AuthStatus::InvalidInput;
    }

    UserMap all = users.load();
    if (all.count(username)) {
        spdlog::warn("Registration failed: username '{}' already exists", username);
        return AuthStatus::AlreadyExists;
    }

    // The first account is the admin no matter what was asked for
    if (all.empty() && role != Role::Admin) {
        spdlog::info("First user '{}' promoted to admin", username);
        role = Role::Admin;
    }

    all.emplace(username, UserRecord(username, PasswordHasher::digest(password), role));
    users.save(all);

    spdlog::info("Registration successful for '{}' ({})", username, roleToString(role));
    return AuthStatus::Ok;
}

AuthStatus AuthManager::setPassword(const std::string& username, const std::string& newPassword) {
    if (newPassword.empty()) {
        spdlog::warn("Password change for '{}' refused: empty password", username);
        return AuthStatus::InvalidInput;
    }

    if (!Storage::isStorableText(username)) {
        spdlog::warn("Password change refused: username is not valid UTF-8");
        return AuthStatus::InvalidInput;
    }

    auto user = users.find(username);
    if (!user) {
        spdlog::warn("Password change failed: '{}' not found", username);
        return AuthStatus::NotFound;
    }

    user->password_hash = PasswordHasher::digest(newPassword);
    users.upsert(*user);

    spdlog::info("Password updated for '{}'", username);
    return AuthStatus::Ok;
}
