#include "Storage.hpp"
#include "StorageError.hpp"
#include <fstream>
#include <sstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

bool Storage::readDocument(const fs::path& file, nlohmann::json& out) {
    spdlog::debug("Reading '{}'", file.string());

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        spdlog::info("'{}' not found; treating as empty", file.string());
        return false;
    }

    std::ifstream in(file);
    if (!in) {
        spdlog::error("Failed to open '{}' for reading", file.string());
        throw StorageError(StorageError::Kind::Corrupt, "cannot open '" + file.string() + "'");
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();

    try {
        out = nlohmann::json::parse(buffer.str());
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("'{}' is not valid JSON: {}", file.string(), e.what());
        throw StorageError(StorageError::Kind::Corrupt, "'" + file.string() + "' is not valid JSON");
    }

    return true;
}

void Storage::writeDocument(const fs::path& file, const nlohmann::json& doc) {
    std::string text;
    try {
        text = doc.dump(4, ' ', false, nlohmann::json::error_handler_t::strict);
    }
    catch (const nlohmann::json::type_error& e) {
        spdlog::error("Refusing to write '{}': {}", file.string(), e.what());
        throw StorageError(StorageError::Kind::Write, "'" + file.string() + "' would hold text that is not UTF-8");
    }

    std::error_code ec;
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create '{}': {}", file.parent_path().string(), ec.message());
            throw StorageError(StorageError::Kind::Write, "cannot create directory '" + file.parent_path().string() + "'");
        }
    }

    fs::path tmp = file;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for writing", tmp.string());
            throw StorageError(StorageError::Kind::Write, "cannot open '" + tmp.string() + "' for writing");
        }

        out << text << "\n";
        out.flush();
        if (!out) {
            spdlog::error("Write to '{}' failed", tmp.string());
            fs::remove(tmp, ec);
            throw StorageError(StorageError::Kind::Write, "write to '" + tmp.string() + "' failed");
        }
    }

    fs::rename(tmp, file, ec);
    if (ec) {
        spdlog::error("Failed to replace '{}': {}", file.string(), ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StorageError(StorageError::Kind::Write, "cannot replace '" + file.string() + "'");
    }

    spdlog::debug("Wrote '{}'", file.string());
}

bool Storage::isStorableText(const std::string& text) {
    try {
        (void)nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
        return true;
    }
    catch (const nlohmann::json::type_error&) {
        return false;
    }
}
