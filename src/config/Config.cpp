#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace cfi::config {

static Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a YAML mapping");

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["secrets"]) YAML::convert<SecretsConfig>::decode(node, cfg.secrets);
    if (auto node = root["credentials"]) YAML::convert<CredentialsConfig>::decode(node, cfg.credentials);
    if (auto node = root["settings"]) YAML::convert<SettingsConfig>::decode(node, cfg.settings);
    if (auto node = root["invalidation"]) YAML::convert<InvalidationConfig>::decode(node, cfg.invalidation);

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    try {
        return decodeRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file " + path.string() + ": " + e.what());
    }
}

Config loadConfigFromString(const std::string& yaml) {
    try {
        return decodeRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
}

}
