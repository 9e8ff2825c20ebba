#pragma once
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

// Storage handles whole-document JSON files.
//
// readDocument: returns false (and leaves `out` untouched) when the file does
//   not exist; throws StorageError(Corrupt) when it exists but is not JSON.
// writeDocument: writes "<file>.tmp" next to the target, then renames it over
//   the target, so a reader sees either the old or the new document.
//   Creates the parent directory if needed. Throws StorageError(Write),
//   also when a key or string is not valid UTF-8 (nothing is rewritten).
// isStorableText: true when `text` survives a write unchanged (valid UTF-8).

class Storage {
public:
    static bool readDocument(const std::filesystem::path& file, nlohmann::json& out);
    static void writeDocument(const std::filesystem::path& file, const nlohmann::json& doc);
    static bool isStorableText(const std::string& text);
};
