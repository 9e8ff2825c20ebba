#pragma once
#include <stdexcept>
#include <string>

// Raised by the stores and passed through the core untouched.
class StorageError : public std::runtime_error {
public:
    enum class Kind {
        Corrupt, // persisted text could not be parsed
        Write    // the collection could not be written
    };

    StorageError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};
