#pragma once
#include <string>
#include <stdexcept>

struct StorageConfig {
    std::string data_dir = "data";
};

struct AuthConfig {
    int max_attempts = 5;
    int freeze_seconds = 30;
    int reset_code_ttl_seconds = 300;
    int reset_code_length = 6;
    int reset_max_code_attempts = 5;
};

struct LoggingConfig {
    std::string file = "bastion.log";
    std::string level = "info";
};

struct Config {
    StorageConfig storage;
    AuthConfig auth;
    LoggingConfig logging;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Reads `path` (YAML). A missing file yields defaults; environment
// variables BASTION_DATA_DIR, BASTION_MAX_ATTEMPTS, BASTION_FREEZE_SECONDS
// and BASTION_LOG_LEVEL override whatever the file says.
Config loadConfig(const std::string& path);

// Throws ConfigError when a value is out of range.
void validateConfig(const Config& cfg);
