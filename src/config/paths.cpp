#include "config/paths.hpp"

#include <cstdlib>
#include <optional>

namespace fs = std::filesystem;

namespace px::paths {

namespace {
std::optional<fs::path> logPathOverride;
std::optional<fs::path> configPathOverride;
}

fs::path getConfigPath() {
    if (configPathOverride) return *configPathOverride;
    if (const char* env = std::getenv("PACKXFER_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

fs::path getLogPath() {
    if (logPathOverride) return *logPathOverride;
    return DEFAULT_LOG_DIR;
}

void setLogPathForTesting() { logPathOverride = fs::temp_directory_path() / "packxfer_test_logs"; }

void setConfigPathForTesting(const fs::path& path) { configPathOverride = path; }

}
