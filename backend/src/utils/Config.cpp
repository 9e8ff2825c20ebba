#include "Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

// Present keys must convert; absent keys keep the default.
template <typename T> static T getOrDefault(const YAML::Node& node, const std::string& key, const T& def) {
    return node[key] ? node[key].as<T>() : def;
}

namespace YAML {

template<>
struct convert<StorageConfig> {
    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.data_dir = getOrDefault(node, "data_dir", rhs.data_dir);
        return true;
    }
};

template<>
struct convert<AuthConfig> {
    static bool decode(const Node& node, AuthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_attempts = getOrDefault(node, "max_attempts", rhs.max_attempts);
        rhs.freeze_seconds = getOrDefault(node, "freeze_seconds", rhs.freeze_seconds);
        rhs.reset_code_ttl_seconds = getOrDefault(node, "reset_code_ttl_seconds", rhs.reset_code_ttl_seconds);
        rhs.reset_code_length = getOrDefault(node, "reset_code_length", rhs.reset_code_length);
        rhs.reset_max_code_attempts = getOrDefault(node, "reset_max_code_attempts", rhs.reset_max_code_attempts);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.file = getOrDefault(node, "file", rhs.file);
        rhs.level = getOrDefault(node, "level", rhs.level);
        return true;
    }
};

}

static int envInt(const char* name, const char* value) {
    try {
        std::size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != std::string(value).size()) throw std::invalid_argument(value);
        return v;
    }
    catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " is not an integer: '" + value + "'");
    }
}

Config loadConfig(const std::string& path) {
    Config cfg;

    if (!path.empty() && std::filesystem::exists(path)) {
        try {
            YAML::Node root = YAML::LoadFile(path);
            if (auto node = root["storage"]) {
                if (!YAML::convert<StorageConfig>::decode(node, cfg.storage))
                    throw ConfigError("'storage' must be a map");
            }
            if (auto node = root["auth"]) {
                if (!YAML::convert<AuthConfig>::decode(node, cfg.auth))
                    throw ConfigError("'auth' must be a map");
            }
            if (auto node = root["logging"]) {
                if (!YAML::convert<LoggingConfig>::decode(node, cfg.logging))
                    throw ConfigError("'logging' must be a map");
            }
        }
        catch (const YAML::Exception& e) {
            throw ConfigError("Failed to parse config '" + path + "': " + e.what());
        }
    }

    if (const char* dir = std::getenv("BASTION_DATA_DIR")) cfg.storage.data_dir = dir;
    if (const char* n = std::getenv("BASTION_MAX_ATTEMPTS")) cfg.auth.max_attempts = envInt("BASTION_MAX_ATTEMPTS", n);
    if (const char* s = std::getenv("BASTION_FREEZE_SECONDS")) cfg.auth.freeze_seconds = envInt("BASTION_FREEZE_SECONDS", s);
    if (const char* lvl = std::getenv("BASTION_LOG_LEVEL")) cfg.logging.level = lvl;

    validateConfig(cfg);
    return cfg;
}

void validateConfig(const Config& cfg) {
    if (cfg.storage.data_dir.empty())
        throw ConfigError("storage.data_dir must not be empty");
    if (cfg.auth.max_attempts < 1)
        throw ConfigError("auth.max_attempts must be at least 1");
    if (cfg.auth.freeze_seconds < 0)
        throw ConfigError("auth.freeze_seconds must not be negative");
    if (cfg.auth.reset_code_ttl_seconds < 1)
        throw ConfigError("auth.reset_code_ttl_seconds must be at least 1");
    if (cfg.auth.reset_code_length < 4 || cfg.auth.reset_code_length > 32)
        throw ConfigError("auth.reset_code_length must be between 4 and 32");
    if (cfg.auth.reset_max_code_attempts < 1)
        throw ConfigError("auth.reset_max_code_attempts must be at least 1");
    if (cfg.logging.file.empty())
        throw ConfigError("logging.file must not be empty");
    if (spdlog::level::from_str(cfg.logging.level) == spdlog::level::off && cfg.logging.level != "off")
        throw ConfigError("logging.level '" + cfg.logging.level + "' is not a known level");
}
