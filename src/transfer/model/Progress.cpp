#include "transfer/model/Progress.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace px::transfer::model;

std::string px::transfer::model::to_string(const Operation op) {
    switch (op) {
        case Operation::Backup: return "backup";
        case Operation::Restore: return "restore";
        case Operation::Download: return "download";
        case Operation::Cleanup: return "cleanup";
        case Operation::Verify: return "verify";
        default: return "unknown";
    }
}

Operation px::transfer::model::parseOperation(const std::string& str) {
    if (str == "backup") return Operation::Backup;
    if (str == "restore") return Operation::Restore;
    if (str == "download") return Operation::Download;
    if (str == "cleanup") return Operation::Cleanup;
    if (str == "verify") return Operation::Verify;
    throw std::invalid_argument("Invalid operation string: " + str);
}

std::string ItemState::statusToString() const {
    switch (status) {
        case Status::Pending: return "pending";
        case Status::InProgress: return "in_progress";
        case Status::Completed: return "completed";
        case Status::Failed: return "failed";
        default: return "unknown";
    }
}

Progress::Status Progress::status() const {
    if (settledItems() < total_items && !finished && !cancelled) return Status::Running;
    if (failed_items == 0 && !cancelled && settledItems() == total_items) return Status::Completed;
    return Status::Failed;
}

std::string px::transfer::model::to_string(const Progress::Status status) {
    switch (status) {
        case Progress::Status::Running: return "running";
        case Progress::Status::Completed: return "completed";
        case Progress::Status::Failed: return "failed";
        default: return "unknown";
    }
}

void px::transfer::model::to_json(nlohmann::json& j, const ItemState& state) {
    j = {
        {"item", state.item},
        {"status", state.statusToString()},
        {"bytes_transferred", state.bytes_transferred}
    };
    if (state.error) j["error"] = *state.error;
}

void px::transfer::model::to_json(nlohmann::json& j, const Progress& progress) {
    j = {
        {"operation", to_string(progress.operation)},
        {"status", to_string(progress.status())},
        {"total_items", progress.total_items},
        {"completed_items", progress.completed_items},
        {"failed_items", progress.failed_items},
        {"total_bytes", progress.total_bytes},
        {"transferred_bytes", progress.transferred_bytes},
        {"bytes_per_second", progress.bytes_per_second},
        {"elapsed_seconds", progress.elapsed_seconds},
        {"errors", progress.errors},
        {"can_resume", progress.can_resume},
        {"cancelled", progress.cancelled},
        {"items", progress.items}
    };

    j["current_item"] = progress.current_item ? nlohmann::json(*progress.current_item) : nlohmann::json(nullptr);
    j["eta_seconds"] = progress.eta_seconds ? nlohmann::json(*progress.eta_seconds) : nlohmann::json(nullptr);
}
