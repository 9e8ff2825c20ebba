#pragma once
#include <string>
#include <optional>

enum class Role {
    Admin,
    User
};

std::string roleToString(Role role);
std::optional<Role> roleFromString(const std::string& s);

class UserRecord {
public:
    UserRecord() = default;
    UserRecord(const std::string& user, const std::string& hash, Role role = Role::User);

    std::string username;
    std::string password_hash; // hex SHA-256 of the password, unsalted
    Role role = Role::User;

    bool isAdmin() const { return role == Role::Admin; }
};
