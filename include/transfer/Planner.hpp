#pragma once

#include "transfer/model/Item.hpp"
#include "transfer/model/Location.hpp"

#include <functional>
#include <string>
#include <vector>

namespace px::transfer {

// Reports where a blob lives right now. Must reflect current membership.
using Locator = std::function<model::Location(const std::string& id)>;

struct Planner {
    // Local-only blobs that still need a backup copy
    static std::vector<model::Item> backup(const std::vector<model::Item>& candidates, const Locator& locate);

    // Backup-only blobs to bring back locally
    static std::vector<model::Item> restore(const std::vector<model::Item>& candidates, const Locator& locate);

    // Blobs present locally and confirmed in backup; never local-only ones
    static std::vector<model::Item> cleanup(const std::vector<model::Item>& candidates, const Locator& locate);
};

}
