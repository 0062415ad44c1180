#include "transfer/model/Outcome.hpp"

using namespace px::transfer::model;

bool Failure::isFatal() const {
    return kind == Kind::InsufficientSpace || kind == Kind::BackupDisabled;
}

std::string Failure::kindToString() const {
    switch (kind) {
        case Kind::Transient: return "transient";
        case Kind::Timeout: return "timeout";
        case Kind::NotConnected: return "not_connected";
        case Kind::NotFound: return "not_found";
        case Kind::BackupDisabled: return "backup_disabled";
        case Kind::InsufficientSpace: return "insufficient_space";
        default: return "unknown";
    }
}

Failure::Kind px::transfer::model::parseFailureKind(const std::string& str) {
    if (str == "transient") return Failure::Kind::Transient;
    if (str == "timeout") return Failure::Kind::Timeout;
    if (str == "not_connected") return Failure::Kind::NotConnected;
    if (str == "not_found") return Failure::Kind::NotFound;
    if (str == "backup_disabled") return Failure::Kind::BackupDisabled;
    if (str == "insufficient_space") return Failure::Kind::InsufficientSpace;
    throw std::invalid_argument("Invalid failure kind: " + str);
}
