#pragma once

#include "transfer/model/Item.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace px::transfer::model {

enum class Operation { Backup, Restore, Download, Cleanup, Verify };

std::string to_string(Operation op);
Operation parseOperation(const std::string& str);

struct ItemState {
    enum class Status { Pending, InProgress, Completed, Failed };

    Item item;
    Status status{Status::Pending};
    std::optional<std::string> error;
    uint64_t bytes_transferred{};   // 0 or item.size_bytes, never partial

    [[nodiscard]] std::string statusToString() const;
};

/**
 * Value snapshot of one run, republished after every item settles.
 *
 * Invariants for every published snapshot:
 *   completed_items + failed_items <= total_items
 *   transferred_bytes <= total_bytes
 *   errors.size() == failed_items
 *
 * Status is derived from the counters and the run flags.
 */
struct Progress {
    enum class Status { Running, Completed, Failed };

    Operation operation{Operation::Backup};

    uint64_t total_items{};
    uint64_t completed_items{};
    uint64_t failed_items{};

    uint64_t total_bytes{};
    uint64_t transferred_bytes{};

    std::optional<Item> current_item;

    double bytes_per_second{};
    std::optional<double> eta_seconds;   // empty means unknown, never "0s"
    double elapsed_seconds{};

    std::vector<std::string> errors;
    bool can_resume = true;
    bool cancelled = false;              // cancel() kept at least one item from starting
    bool finished = false;               // no further items will start in this run

    std::vector<ItemState> items;

    [[nodiscard]] Status status() const;
    [[nodiscard]] uint64_t settledItems() const { return completed_items + failed_items; }
    [[nodiscard]] bool canRetry() const { return can_resume && failed_items > 0; }
};

std::string to_string(Progress::Status status);

void to_json(nlohmann::json& j, const ItemState& state);
void to_json(nlohmann::json& j, const Progress& progress);

}
