#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace px::transfer::model {

// One blob to move. Built by the caller, never mutated by the engine.
struct Item {
    std::string id;            // content-addressed key, usually a sha256
    std::string display_name;
    uint64_t size_bytes{};

    friend bool operator==(const Item&, const Item&) = default;
};

void to_json(nlohmann::json& j, const Item& item);

}
