#pragma once

#include <filesystem>

namespace px::paths {

static constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/packxfer/config.yaml";
static constexpr const auto* DEFAULT_LOG_DIR = "/var/log/packxfer";

// PACKXFER_CONFIG overrides the default location
std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();

void setLogPathForTesting();
void setConfigPathForTesting(const std::filesystem::path& path);

}
