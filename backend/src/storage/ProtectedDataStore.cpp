#include "ProtectedDataStore.hpp"
#include "Storage.hpp"
#include "StorageError.hpp"
#include <spdlog/spdlog.h>

void ProtectedDataStore::appendNote(const std::string& username, const Note& note) {
    ProtectedMap records = load();

    auto& rec = records[username];
    rec.username = username;
    rec.notes.push_back(note);

    save(records);
    spdlog::debug("Appended note #{} for '{}'", rec.notes.size(), username);
}

void ProtectedDataStore::appendFile(const std::string& username, const FileRef& file) {
    ProtectedMap records = load();

    auto& rec = records[username];
    rec.username = username;
    rec.files.push_back(file);

    save(records);
    spdlog::debug("Appended file reference '{}' for '{}'", file.name, username);
}

std::vector<Note> ProtectedDataStore::listNotes(const std::string& username) const {
    ProtectedMap records = load();
    auto it = records.find(username);
    if (it == records.end()) return {};
    return it->second.notes;
}

std::vector<FileRef> ProtectedDataStore::listFiles(const std::string& username) const {
    ProtectedMap records = load();
    auto it = records.find(username);
    if (it == records.end()) return {};
    return it->second.files;
}

JsonProtectedDataStore::JsonProtectedDataStore(const std::filesystem::path& f)
    : file(f)
{
}

static std::time_t timeFromJson(const nlohmann::json& j, const char* field) {
    std::time_t t = 0;
    if (!parseIsoTime(j.at(field).get<std::string>(), t))
        throw StorageError(StorageError::Kind::Corrupt, std::string("malformed timestamp in '") + field + "'");
    return t;
}

static ProtectedRecord recordFromJson(const std::string& key, const nlohmann::json& j) {
    ProtectedRecord rec;

    try {
        rec.username = j.at("username").get<std::string>();

        for (const auto& n : j.at("notes")) {
            Note note;
            note.content = n.at("content").get<std::string>();
            note.created_at = timeFromJson(n, "createdAt");
            rec.notes.push_back(note);
        }

        for (const auto& f : j.at("files")) {
            FileRef ref;
            ref.name = f.at("name").get<std::string>();
            ref.added_at = timeFromJson(f, "addedAt");
            rec.files.push_back(ref);
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw StorageError(StorageError::Kind::Corrupt, "protected entry '" + key + "': " + e.what());
    }

    if (rec.username != key)
        throw StorageError(StorageError::Kind::Corrupt, "protected entry '" + key + "' names '" + rec.username + "'");

    return rec;
}

ProtectedMap JsonProtectedDataStore::load() const {
    nlohmann::json doc;
    ProtectedMap records;

    if (!Storage::readDocument(file, doc))
        return records;

    if (!doc.is_object()) {
        spdlog::error("'{}' does not hold a record map", file.string());
        throw StorageError(StorageError::Kind::Corrupt, "'" + file.string() + "' does not hold a record map");
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!it.value().is_object())
            throw StorageError(StorageError::Kind::Corrupt, "protected entry '" + it.key() + "' is not an object");
        records.emplace(it.key(), recordFromJson(it.key(), it.value()));
    }

    spdlog::debug("Loaded {} protected records from '{}'", records.size(), file.string());
    return records;
}

void JsonProtectedDataStore::save(const ProtectedMap& records) {
    nlohmann::json doc = nlohmann::json::object();

    for (const auto& [name, rec] : records) {
        nlohmann::json notes = nlohmann::json::array();
        for (const auto& n : rec.notes)
            notes.push_back(nlohmann::json{ { "content", n.content }, { "createdAt", formatIsoTime(n.created_at) } });

        nlohmann::json files = nlohmann::json::array();
        for (const auto& f : rec.files)
            files.push_back(nlohmann::json{ { "name", f.name }, { "addedAt", formatIsoTime(f.added_at) } });

        doc[name] = {
            { "username", rec.username },
            { "notes", notes },
            { "files", files }
        };
    }

    Storage::writeDocument(file, doc);
    spdlog::info("Saved {} protected records to '{}'", records.size(), file.string());
}
