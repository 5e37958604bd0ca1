#include "config/ConfigRegistry.hpp"
#include "storage/errors.hpp"

namespace sbs::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = loadConfig(path);
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw storage::ConfigError("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace sbs::config
