#pragma once

#include <cstddef>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace px::config {

struct TransferConfig {
    std::size_t rate_window_samples = 5;
    double rate_smoothing = 0.3;        // weight of the newest instantaneous rate
    bool reject_duplicate_ids = false;  // default is to process duplicates independently
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum packxfer = spdlog::level::info;   // Registry and process-level events
    spdlog::level::level_enum transfer = spdlog::level::info;   // Run start/finish, item failures
    spdlog::level::level_enum chain    = spdlog::level::info;   // Phase transitions
    spdlog::level::level_enum config   = spdlog::level::warn;   // Malformed or missing config
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct Config {
    TransferConfig transfer;
    LoggingConfig logging;

    void validate() const;
};

Config loadConfig(const std::string& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const TransferConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace px::config
