#pragma once

#include "transfer/Executor.hpp"
#include "transfer/RateEstimator.hpp"
#include "transfer/model/Progress.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace px::config { struct TransferConfig; }

namespace px::transfer {

/**
 * Drives an ordered item list through a caller-supplied Executor, one item
 * at a time, publishing a Progress snapshot after every settled item.
 *
 * Each run executes on a worker thread owned by the Runner. Listeners are
 * invoked on that thread. progress(), cancel() and isRunning() only take a
 * short internal lock and never wait on the executor.
 */
class Runner {
public:
    using ProgressListener = std::function<void(const model::Progress&)>;
    using ItemListener = std::function<void(const model::Item&, const model::Outcome&)>;

    enum class DuplicatePolicy { Process, Reject };

    struct Options {
        RateEstimator::Options rate{};
        DuplicatePolicy duplicates{DuplicatePolicy::Process};

        static Options fromConfig(const config::TransferConfig& cfg);

        // Options from the loaded ConfigRegistry, or defaults when it is not initialized
        static Options fromRegistry();
    };

    // Uses Options::fromRegistry()
    explicit Runner(model::Operation operation = model::Operation::Backup);
    Runner(model::Operation operation, Options opts);
    ~Runner();

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    // False when a run is already active or the list violates the duplicate policy
    bool start(std::vector<model::Item> items, std::shared_ptr<Executor> executor);

    // Re-runs only the items that failed in the previous run
    bool retryFailed(std::shared_ptr<Executor> executor);

    void cancel();
    void reset();

    // Blocks until the active run ends; returns its terminal snapshot
    std::optional<model::Progress> wait();

    [[nodiscard]] std::optional<model::Progress> progress() const;
    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] model::Operation operation() const { return operation_; }

    void subscribe(ProgressListener listener);
    void onItemSettled(ItemListener listener);
    void onComplete(ProgressListener listener);

private:
    using Clock = std::chrono::steady_clock;

    model::Operation operation_;
    Options opts_;

    std::shared_ptr<const std::vector<model::Item>> items_;
    std::shared_ptr<Executor> executor_;

    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    std::optional<model::Progress> progress_;
    RateEstimator rate_;
    Clock::time_point startedAt_{};
    uint64_t runBytes_{};
    bool skippedByCancel_ = false;   // items a cancelled run never started are still pending

    std::mutex listenerMutex_;
    std::vector<ProgressListener> progressListeners_;
    std::vector<ItemListener> itemListeners_;
    std::vector<ProgressListener> completeListeners_;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<std::thread::id> workerId_{};
    std::thread worker_;

    struct Saved {
        std::optional<model::Progress> progress;
        std::shared_ptr<const std::vector<model::Item>> items;
        bool skippedByCancel = false;
    };

    bool claimRun(const char* caller);
    Saved save() const;
    void releaseClaim(Saved previous);
    void launch(std::vector<std::size_t> queue);
    void runLoop(const std::vector<std::size_t>& queue);
    model::Outcome settle(const model::Item& item);
    void record(std::size_t index, const model::Outcome& outcome, std::optional<std::size_t> next, bool cancelled);
    void finish(bool cancelled);
    void complete();
    void publish(const model::Progress& snapshot);
    void notifyItem(const model::Item& item, const model::Outcome& outcome);
    static void invoke(const ProgressListener& listener, const model::Progress& snapshot);
    void joinWorker();
};

}
