#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace cfi::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum cfinvalidator = spdlog::level::info;   // Startup, CLI actions
    spdlog::level::level_enum crypto        = spdlog::level::warn;   // Encrypt/decrypt failures only
    spdlog::level::level_enum credentials   = spdlog::level::warn;   // Resolution gaps, fallbacks
    spdlog::level::level_enum settings      = spdlog::level::info;   // Rejected fields, migrations
    spdlog::level::level_enum invalidation  = spdlog::level::info;   // Built and failed requests
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/cfinvalidator";
    LogLevelsConfig levels;
};

struct SecretsConfig {
    // Concatenated in order before hashing; order matters.
    std::vector<std::string> keys;
    std::string fallback_salt;
};

struct CredentialsConfig {
    // Deployment constants, checked before the process environment.
    std::map<std::string, std::string> constants;
    std::string access_key_name = "CLOUDFRONT_AWS_ACCESS_KEY";
    std::string secret_key_name = "CLOUDFRONT_AWS_SECRET_KEY";
};

struct SettingsConfig {
    std::filesystem::path path = "/var/lib/cfinvalidator/settings.json";
};

struct InvalidationConfig {
    std::string request_token_prefix = "cfi-";
    unsigned int token_suffix_length = 6;
};

struct Config {
    LoggingConfig logging;
    SecretsConfig secrets;
    CredentialsConfig credentials;
    SettingsConfig settings;
    InvalidationConfig invalidation;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

}
