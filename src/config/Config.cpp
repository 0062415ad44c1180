#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace px::config {

Config loadConfig(const std::string& path) {
    Config cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file " + path + ": " + e.what());
    }

    if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    cfg.validate();
    return cfg;
}

void Config::validate() const {
    if (transfer.rate_window_samples < 2)
        throw std::invalid_argument("transfer.rate_window_samples must be at least 2");
    if (!(transfer.rate_smoothing > 0.0 && transfer.rate_smoothing <= 1.0))
        throw std::invalid_argument("transfer.rate_smoothing must be in (0, 1]");
}

void to_json(nlohmann::json& j, const TransferConfig& c) {
    j = {
        {"rate_window_samples", c.rate_window_samples},
        {"rate_smoothing", c.rate_smoothing},
        {"reject_duplicate_ids", c.reject_duplicate_ids}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    const auto level = [](const spdlog::level::level_enum lvl) {
        const auto sv = spdlog::level::to_string_view(lvl);
        return std::string(sv.data(), sv.size());
    };

    const auto& sub = c.levels.subsystem_levels;
    j = {
        {"console_log_level", level(c.levels.console_log_level)},
        {"file_log_level", level(c.levels.file_log_level)},
        {"subsystem_levels", {
            {"packxfer", level(sub.packxfer)},
            {"transfer", level(sub.transfer)},
            {"chain", level(sub.chain)},
            {"config", level(sub.config)}
        }}
    };
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"transfer", c.transfer},
        {"logging", c.logging}
    };
}

} // namespace px::config
