#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace px::transfer::model {

struct Failure {
    enum class Kind {
        Transient,
        Timeout,
        NotConnected,
        NotFound,
        BackupDisabled,
        InsufficientSpace
    };

    Kind kind{Kind::Transient};
    std::string message;

    // Fatal kinds halt the queue and make the run unresumable
    [[nodiscard]] bool isFatal() const;
    [[nodiscard]] std::string kindToString() const;
};

Failure::Kind parseFailureKind(const std::string& str);

// Result of one executor call: empty failure means the item succeeded.
struct Outcome {
    std::optional<Failure> failure;

    [[nodiscard]] bool ok() const { return !failure.has_value(); }

    static Outcome success() { return {}; }
    static Outcome failed(Failure::Kind kind, std::string message) {
        return Outcome{Failure{kind, std::move(message)}};
    }
};

// Executors may throw this instead of returning a failed Outcome.
class TransferError : public std::runtime_error {
public:
    TransferError(const Failure::Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Failure::Kind kind() const { return kind_; }

private:
    Failure::Kind kind_;
};

}
