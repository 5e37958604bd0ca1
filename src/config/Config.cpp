#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "storage/errors.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace sbs::config {

std::string expandEnv(const std::string& value) {
    if (value.size() < 4 || !value.starts_with("${") || !value.ends_with("}")) return value;

    const std::string name = value.substr(2, value.size() - 3);
    const char* env = std::getenv(name.c_str());
    if (!env || !*env) throw storage::ConfigError("Environment variable unreadable: " + name);
    return env;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw storage::ConfigError("Failed to load config " + path.string() + ": " + e.what());
    }

    try {
        if (auto node = root["storage"]; node && !YAML::convert<StorageConfig>::decode(node, cfg.storage))
            throw storage::ConfigError("Invalid 'storage' section in " + path.string());
        if (auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
            throw storage::ConfigError("Invalid 'logging' section in " + path.string());
    } catch (const YAML::Exception& e) {
        throw storage::ConfigError("Invalid config " + path.string() + ": " + e.what());
    }

    cfg.storage.url = expandEnv(cfg.storage.url);
    cfg.storage.api_key = expandEnv(cfg.storage.api_key);

    return cfg;
}

// Never includes the API key.
void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"url", c.url},
        {"headers", c.headers}
    };
}

}
