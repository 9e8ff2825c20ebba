#include "CredentialStore.hpp"
#include "Storage.hpp"
#include "StorageError.hpp"
#include <spdlog/spdlog.h>

std::optional<UserRecord> CredentialStore::find(const std::string& username) const {
    UserMap users = load();
    auto it = users.find(username);
    if (it == users.end()) return std::nullopt;
    return it->second;
}

void CredentialStore::upsert(const UserRecord& record) {
    UserMap users = load();
    users[record.username] = record;
    save(users);
}

JsonCredentialStore::JsonCredentialStore(const std::filesystem::path& f)
    : file(f)
{
}

static UserRecord userFromJson(const std::string& key, const nlohmann::json& j) {
    if (!j.is_object())
        throw StorageError(StorageError::Kind::Corrupt, "user entry '" + key + "' is not an object");

    UserRecord u;
    std::string role;
    try {
        u.username = j.at("username").get<std::string>();
        u.password_hash = j.at("passwordHash").get<std::string>();
        role = j.at("role").get<std::string>();
    }
    catch (const nlohmann::json::exception& e) {
        throw StorageError(StorageError::Kind::Corrupt, "user entry '" + key + "': " + e.what());
    }

    if (u.username != key)
        throw StorageError(StorageError::Kind::Corrupt, "user entry '" + key + "' names '" + u.username + "'");

    auto r = roleFromString(role);
    if (!r)
        throw StorageError(StorageError::Kind::Corrupt, "user entry '" + key + "' has unknown role '" + role + "'");
    u.role = *r;

    return u;
}

UserMap JsonCredentialStore::load() const {
    nlohmann::json doc;
    UserMap users;

    if (!Storage::readDocument(file, doc))
        return users;

    if (!doc.is_object()) {
        spdlog::error("'{}' does not hold a user map", file.string());
        throw StorageError(StorageError::Kind::Corrupt, "'" + file.string() + "' does not hold a user map");
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (it.key().empty())
            throw StorageError(StorageError::Kind::Corrupt, "empty username in '" + file.string() + "'");
        users.emplace(it.key(), userFromJson(it.key(), it.value()));
    }

    spdlog::debug("Loaded {} user entries from '{}'", users.size(), file.string());
    return users;
}

void JsonCredentialStore::save(const UserMap& users) {
    nlohmann::json doc = nlohmann::json::object();

    for (const auto& [name, u] : users) {
        doc[name] = {
            { "username", u.username },
            { "passwordHash", u.password_hash },
            { "role", roleToString(u.role) }
        };
    }

    Storage::writeDocument(file, doc);
    spdlog::info("Saved {} user entries to '{}'", users.size(), file.string());
}
