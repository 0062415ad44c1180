#include "util/format.hpp"

#include <array>
#include <cmath>
#include <fmt/format.h>

namespace px::util {

std::string formatBytes(const uint64_t bytes) {
    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) return fmt::format("{} B", bytes);

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

std::string formatDuration(const double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) return "unknown";

    const auto total = static_cast<uint64_t>(std::llround(seconds));
    const auto h = total / 3600, m = (total % 3600) / 60, s = total % 60;

    if (h > 0) return fmt::format("{}h {}m {}s", h, m, s);
    if (m > 0) return fmt::format("{}m {}s", m, s);
    return fmt::format("{}s", s);
}

std::string formatEta(const std::optional<double>& etaSeconds) {
    if (!etaSeconds) return "unknown";
    return formatDuration(*etaSeconds);
}

std::string formatRate(const double bytesPerSecond) {
    if (!(bytesPerSecond > 0.0)) return "0 B/s";
    return formatBytes(static_cast<uint64_t>(bytesPerSecond)) + "/s";
}

}
