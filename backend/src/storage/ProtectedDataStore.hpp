#pragma once
#include <map>
#include <string>
#include <vector>
#include <filesystem>
#include "../core/Note.hpp"

using ProtectedMap = std::map<std::string, ProtectedRecord>;

// Same load-modify-save contract as CredentialStore. Records are created on
// first write and are not removed with their user.
class ProtectedDataStore {
public:
    virtual ~ProtectedDataStore() = default;

    virtual ProtectedMap load() const = 0;
    virtual void save(const ProtectedMap& records) = 0;

    void appendNote(const std::string& username, const Note& note);
    void appendFile(const std::string& username, const FileRef& file);

    // Insertion order; empty when the user has no data yet.
    std::vector<Note> listNotes(const std::string& username) const;
    std::vector<FileRef> listFiles(const std::string& username) const;
};

// protected_data.json:
// { "<username>": { "username", "notes": [{ "content", "createdAt" }],
//                   "files": [{ "name", "addedAt" }] }, ... }
class JsonProtectedDataStore : public ProtectedDataStore {
public:
    explicit JsonProtectedDataStore(const std::filesystem::path& file);

    ProtectedMap load() const override;
    void save(const ProtectedMap& records) override;

    const std::filesystem::path& path() const { return file; }

private:
    std::filesystem::path file;
};
