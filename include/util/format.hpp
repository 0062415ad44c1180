#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace px::util {

// 1536 -> "1.5 KB"
std::string formatBytes(uint64_t bytes);

// 3725 -> "1h 2m 5s"
std::string formatDuration(double seconds);

// Unknown ETA renders as "unknown", never as "0s"
std::string formatEta(const std::optional<double>& etaSeconds);

std::string formatRate(double bytesPerSecond);

}
