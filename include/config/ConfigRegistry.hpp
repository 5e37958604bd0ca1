#pragma once

#include "config/Config.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>

namespace sbs::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;
};

} // namespace sbs::config
