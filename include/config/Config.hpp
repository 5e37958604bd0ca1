#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace sbs::config {

constexpr static auto ENV_URL = "SUPABASE_URL";
constexpr static auto ENV_API_KEY = "SUPABASE_API_KEY";

struct StorageConfig {
    std::string url;
    std::string api_key;
    std::map<std::string, std::string> headers;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum storage = spdlog::level::info;   // one line per failed call
    spdlog::level::level_enum http    = spdlog::level::warn;   // transport failures
    spdlog::level::level_enum config  = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    // No file sink when unset.
    std::optional<std::filesystem::path> log_dir;
    LogLevelsConfig levels;
};

struct Config {
    StorageConfig storage;
    LoggingConfig logging;
};

// Throws storage::ConfigError if the file cannot be read or parsed.
Config loadConfig(const std::filesystem::path& path);

// Expands a whole-value "${NAME}" reference from the environment.
std::string expandEnv(const std::string& value);

void to_json(nlohmann::json& j, const StorageConfig& c);

}
