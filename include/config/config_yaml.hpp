#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace cfi::config;

inline spdlog::level::level_enum parse_level(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto lvl = spdlog::level::from_str(node.as<std::string>());
    // from_str() maps unknown names to off; only honour an explicit "off"
    if (lvl == spdlog::level::off && node.as<std::string>() != "off") return def;
    return lvl;
}

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["cfinvalidator"] = to_std_string(spdlog::level::to_string_view(rhs.cfinvalidator));
        node["crypto"]        = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["credentials"]   = to_std_string(spdlog::level::to_string_view(rhs.credentials));
        node["settings"]      = to_std_string(spdlog::level::to_string_view(rhs.settings));
        node["invalidation"]  = to_std_string(spdlog::level::to_string_view(rhs.invalidation));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.cfinvalidator = parse_level(node["cfinvalidator"], def.cfinvalidator);
        rhs.crypto        = parse_level(node["crypto"], def.crypto);
        rhs.credentials   = parse_level(node["credentials"], def.credentials);
        rhs.settings      = parse_level(node["settings"], def.settings);
        rhs.invalidation  = parse_level(node["invalidation"], def.invalidation);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"] = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const LogLevelsConfig def;
        rhs.console_log_level = parse_level(node["console_log_level"], def.console_log_level);
        rhs.file_log_level = parse_level(node["file_log_level"], def.file_log_level);
        if (node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(node["subsystem_levels"], rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = convert<LogLevelsConfig>::encode(rhs.levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/cfinvalidator");
        if (node["levels"]) convert<LogLevelsConfig>::decode(node["levels"], rhs.levels);
        return true;
    }
};

template<>
struct convert<SecretsConfig> {
    static Node encode(const SecretsConfig& rhs) {
        Node node;
        node["keys"] = rhs.keys;
        node["fallback_salt"] = rhs.fallback_salt;
        return node;
    }

    static bool decode(const Node& node, SecretsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.keys = node["keys"].as<std::vector<std::string>>(std::vector<std::string>{});
        rhs.fallback_salt = node["fallback_salt"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<CredentialsConfig> {
    static Node encode(const CredentialsConfig& rhs) {
        Node node;
        node["constants"] = rhs.constants;
        node["access_key_name"] = rhs.access_key_name;
        node["secret_key_name"] = rhs.secret_key_name;
        return node;
    }

    static bool decode(const Node& node, CredentialsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.constants = node["constants"].as<std::map<std::string, std::string>>(std::map<std::string, std::string>{});
        rhs.access_key_name = node["access_key_name"].as<std::string>("CLOUDFRONT_AWS_ACCESS_KEY");
        rhs.secret_key_name = node["secret_key_name"].as<std::string>("CLOUDFRONT_AWS_SECRET_KEY");
        return true;
    }
};

template<>
struct convert<SettingsConfig> {
    static Node encode(const SettingsConfig& rhs) {
        Node node;
        node["path"] = rhs.path.string();
        return node;
    }

    static bool decode(const Node& node, SettingsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = node["path"].as<std::string>("/var/lib/cfinvalidator/settings.json");
        return true;
    }
};

template<>
struct convert<InvalidationConfig> {
    static Node encode(const InvalidationConfig& rhs) {
        Node node;
        node["request_token_prefix"] = rhs.request_token_prefix;
        node["token_suffix_length"] = rhs.token_suffix_length;
        return node;
    }

    static bool decode(const Node& node, InvalidationConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.request_token_prefix = node["request_token_prefix"].as<std::string>("cfi-");
        rhs.token_suffix_length = node["token_suffix_length"].as<unsigned int>(6);
        return true;
    }
};

}
