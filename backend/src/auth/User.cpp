#include "User.hpp"

UserRecord::UserRecord(const std::string& user, const std::string& hash, Role r)
    : username(user), password_hash(hash), role(r)
{
}

std::string roleToString(Role role) {
    return role == Role::Admin ? "admin" : "user";
}

std::optional<Role> roleFromString(const std::string& s) {
    if (s == "admin") return Role::Admin;
    if (s == "user") return Role::User;
    return std::nullopt;
}
