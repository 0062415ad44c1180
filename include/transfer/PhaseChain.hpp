#pragma once

#include "concurrency/OneShotLatch.hpp"
#include "transfer/Runner.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace px::transfer {

/**
 * Backup phase followed by an optional cleanup phase, exposed as one flow.
 *
 *   Idle -> Phase1Running -> Phase1Completed -> [cleanup requested] -> Phase2Running -> Phase2Completed
 *                                                                                    -> Phase2Failed
 *                         -> Phase1Failed
 *
 * The cleanup item set is resolved when phase 1 completes, not when the chain
 * starts, so only blobs that are actually in backup by then get freed. The
 * phase-1 -> phase-2 transition is guarded by a one-shot latch.
 */
class PhaseChain {
public:
    enum class State {
        Idle,
        Phase1Running,
        Phase1Completed,
        Phase1Failed,
        Phase2Running,
        Phase2Completed,
        Phase2Failed
    };

    using CleanupResolver = std::function<std::vector<model::Item>()>;
    using ProgressListener = std::function<void(int phase, const model::Progress&)>;
    using StateListener = std::function<void(State)>;

    struct Plan {
        std::vector<model::Item> items;
        std::shared_ptr<Executor> executor;
        bool cleanupRequested = false;          // captured at start()
        CleanupResolver resolveCleanup;         // required when cleanupRequested
        std::shared_ptr<Executor> cleanupExecutor;
    };

    // Runner options come from Runner::Options::fromRegistry()
    PhaseChain();
    explicit PhaseChain(const Runner::Options& opts);
    ~PhaseChain();

    PhaseChain(const PhaseChain&) = delete;
    PhaseChain& operator=(const PhaseChain&) = delete;

    // False while a phase is running. Not callable from a listener.
    bool start(Plan plan);
    void cancel();

    // Blocks until the chain reaches a terminal state. Not callable from a listener.
    State wait();

    // Phase-1 completion handler; repeated invocations start phase 2 at most once
    void handleBackupSettled(const model::Progress& p);

    [[nodiscard]] State state() const;
    [[nodiscard]] bool isDone() const;
    [[nodiscard]] int activePhase() const;

    // Snapshot of the active phase only; phases are never merged
    [[nodiscard]] std::optional<model::Progress> progress() const;

    void subscribe(ProgressListener listener);
    void onStateChange(StateListener listener);

    Runner& backupRunner() { return backup_; }
    Runner& cleanupRunner() { return cleanup_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_{State::Idle};
    bool done_ = false;

    bool cleanupRequested_ = false;
    CleanupResolver resolver_;
    std::shared_ptr<Executor> cleanupExecutor_;

    std::atomic<bool> cancelled_{false};
    concurrency::OneShotLatch transition_;

    std::mutex listenerMutex_;
    std::vector<ProgressListener> progressListeners_;
    std::vector<StateListener> stateListeners_;

    Runner backup_;
    Runner cleanup_;

    void wire();
    void handleCleanupSettled(const model::Progress& p);
    void transition(State next, bool terminal = false);
    void restore(State previous, bool previousDone);
    void forward(int phase, const model::Progress& p);
};

std::string to_string(PhaseChain::State state);

}
