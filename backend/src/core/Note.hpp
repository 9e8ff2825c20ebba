#pragma once
#include <string>
#include <ctime>
#include <vector>

class Note {
public:
    Note() = default;
    Note(const std::string& content, std::time_t created);

    std::string content;
    std::time_t created_at = 0; // Seconds since epoch, stored as ISO-8601 UTC
};

// File reference; the file itself is never read or copied.
struct FileRef {
    std::string name;
    std::time_t added_at = 0;
};

struct ProtectedRecord {
    std::string username;
    std::vector<Note> notes;
    std::vector<FileRef> files;
};

// "2024-05-01T12:00:00Z" <-> time_t. parseIsoTime returns false on malformed input.
std::string formatIsoTime(std::time_t t);
bool parseIsoTime(const std::string& s, std::time_t& out);
