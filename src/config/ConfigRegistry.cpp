#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace px::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        if (std::filesystem::exists(path)) config_ = loadConfig(path.string());
        else {
            spdlog::warn("[ConfigRegistry] No config at {}, using defaults", path.string());
            config_ = Config{};
        }
        initialized_ = true;
    });
}

void ConfigRegistry::reloadForTesting(const std::filesystem::path& path) {
    std::call_once(init_flag_, [] {});
    config_ = std::filesystem::exists(path) ? loadConfig(path.string()) : Config{};
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace px::config
