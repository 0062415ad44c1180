#pragma once

#include "config/Config.hpp"
#include "config/paths.hpp"

#include <filesystem>
#include <mutex>

namespace px::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = paths::getConfigPath());
    static const Config& get();

    // Replaces the loaded config; a missing file resets to defaults. Not thread-safe.
    static void reloadForTesting(const std::filesystem::path& path);

    [[nodiscard]] static bool isInitialized() { return initialized_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace px::config
