#pragma once
#include <map>
#include <string>
#include <optional>
#include <filesystem>
#include "../auth/User.hpp"

using UserMap = std::map<std::string, UserRecord>;

// The whole user collection round-trips on every mutation: find() loads,
// upsert() loads, modifies and saves. Backends only implement load/save.
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    // Empty map when nothing has been persisted yet.
    virtual UserMap load() const = 0;
    virtual void save(const UserMap& users) = 0;

    std::optional<UserRecord> find(const std::string& username) const;
    void upsert(const UserRecord& record);
    bool empty() const { return load().empty(); }
};

// user_data.json: { "<username>": { "username", "passwordHash", "role" }, ... }
class JsonCredentialStore : public CredentialStore {
public:
    explicit JsonCredentialStore(const std::filesystem::path& file);

    UserMap load() const override;
    void save(const UserMap& users) override;

    const std::filesystem::path& path() const { return file; }

private:
    std::filesystem::path file;
};
