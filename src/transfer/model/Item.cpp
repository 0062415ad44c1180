#include "transfer/model/Item.hpp"
#include "transfer/model/Location.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace px::transfer::model;

void px::transfer::model::to_json(nlohmann::json& j, const Item& item) {
    j = {
        {"id", item.id},
        {"display_name", item.display_name},
        {"size_bytes", item.size_bytes}
    };
}

std::string px::transfer::model::to_string(const Location loc) {
    switch (loc) {
        case Location::LocalOnly: return "local_only";
        case Location::BackupOnly: return "backup_only";
        case Location::Both: return "both";
        case Location::Nowhere: return "nowhere";
        default: return "unknown";
    }
}

Location px::transfer::model::parseLocation(const std::string& str) {
    if (str == "local_only") return Location::LocalOnly;
    if (str == "backup_only") return Location::BackupOnly;
    if (str == "both") return Location::Both;
    if (str == "nowhere") return Location::Nowhere;
    throw std::invalid_argument("Invalid location string: " + str);
}
