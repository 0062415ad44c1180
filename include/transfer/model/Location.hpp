#pragma once

#include <string>

namespace px::transfer::model {

// Where a blob currently lives, as reported by the storage layer.
enum class Location { LocalOnly, BackupOnly, Both, Nowhere };

std::string to_string(Location loc);
Location parseLocation(const std::string& str);

}
