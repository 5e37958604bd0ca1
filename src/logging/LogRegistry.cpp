#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <vector>

namespace sbs::logging {

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    std::call_once(init_flag_, [&] {
        namespace fs = std::filesystem;

        console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink_->set_level(cnf.levels.console_log_level);
        console_sink_->set_color_mode(spdlog::color_mode::automatic);
        console_sink_->set_pattern(LOG_FORMAT);

        std::vector<spdlog::sink_ptr> sinks{console_sink_};

        if (cnf.log_dir) {
            if (!fs::exists(*cnf.log_dir)) fs::create_directories(*cnf.log_dir);
            main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (*cnf.log_dir / "sbstorage.log").string(), main_max_bytes_, main_max_files_);
            main_file_sink_->set_level(cnf.levels.file_log_level);
            main_file_sink_->set_pattern(LOG_FORMAT);
            sinks.push_back(main_file_sink_);
        }

        const auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
            // a logger the host registered under this name takes precedence
            if (spdlog::get(name)) return;
            const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(lvl);
            logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(logger);
        };

        const auto& sub_levels = cnf.levels.subsystem_levels;
        makeLogger(STORAGE_LOGGER, sub_levels.storage);
        makeLogger(HTTP_LOGGER,    sub_levels.http);
        makeLogger(CONFIG_LOGGER,  sub_levels.config);

        initialized_ = true;
    });
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    if (!initialized_) init();
    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
