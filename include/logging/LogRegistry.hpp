#pragma once

#include "config/Config.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace sbs::logging {

class LogRegistry {
public:
    static constexpr auto STORAGE_LOGGER = "sbs.storage";
    static constexpr auto HTTP_LOGGER = "sbs.http";
    static constexpr auto CONFIG_LOGGER = "sbs.config";

    // Initialize all loggers with sinks/levels. Later calls are ignored.
    static void init(const config::LoggingConfig& cnf = {});

    // Generic access by name. Initializes with defaults if init() was never called.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> storage() { return get(STORAGE_LOGGER); }
    static std::shared_ptr<spdlog::logger> http()    { return get(HTTP_LOGGER); }
    static std::shared_ptr<spdlog::logger> config()  { return get(CONFIG_LOGGER); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline std::once_flag init_flag_;
    static inline std::atomic<bool> initialized_{false};

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
