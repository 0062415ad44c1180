#pragma once

#include "config/paths.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace px::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels. Requires ConfigRegistry.
    static void init(const std::filesystem::path& logDir = paths::getLogPath());

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> packxfer() { return get("packxfer"); }
    static std::shared_ptr<spdlog::logger> transfer() { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> chain()    { return get("chain"); }
    static std::shared_ptr<spdlog::logger> config()   { return get("config"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
