#include "transfer/Planner.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

using namespace px::transfer;
using namespace px::transfer::model;

namespace {

std::vector<Item> select(const std::vector<Item>& candidates, const Locator& locate, const Location wanted) {
    if (!locate) throw std::invalid_argument("Planner: null locator");

    std::vector<Item> out;
    std::ranges::copy_if(candidates, std::back_inserter(out),
                         [&](const Item& item) { return locate(item.id) == wanted; });
    return out;
}

}

std::vector<Item> Planner::backup(const std::vector<Item>& candidates, const Locator& locate) {
    return select(candidates, locate, Location::LocalOnly);
}

std::vector<Item> Planner::restore(const std::vector<Item>& candidates, const Locator& locate) {
    return select(candidates, locate, Location::BackupOnly);
}

std::vector<Item> Planner::cleanup(const std::vector<Item>& candidates, const Locator& locate) {
    return select(candidates, locate, Location::Both);
}
