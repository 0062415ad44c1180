#include "transfer/PhaseChain.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace px::transfer;
using namespace px::transfer::model;
using namespace px::logging;

PhaseChain::PhaseChain() : PhaseChain(Runner::Options::fromRegistry()) {}

PhaseChain::PhaseChain(const Runner::Options& opts)
    : backup_(Operation::Backup, opts), cleanup_(Operation::Cleanup, opts) {
    wire();
}

PhaseChain::~PhaseChain() {
    cancel();
    backup_.wait();
    cleanup_.wait();
}

void PhaseChain::wire() {
    backup_.subscribe([this](const Progress& p) { forward(1, p); });
    backup_.onComplete([this](const Progress& p) { handleBackupSettled(p); });
    cleanup_.subscribe([this](const Progress& p) { forward(2, p); });
    cleanup_.onComplete([this](const Progress& p) { handleCleanupSettled(p); });
}

bool PhaseChain::start(Plan plan) {
    if (!plan.executor) throw std::invalid_argument("PhaseChain::start: null backup executor");
    if (plan.cleanupRequested && (!plan.resolveCleanup || !plan.cleanupExecutor))
        throw std::invalid_argument("PhaseChain::start: cleanup requested without resolver and executor");

    State previous = State::Idle;
    bool previousDone = false;
    {
        std::scoped_lock lock(mutex_);
        if (state_ == State::Phase1Running || state_ == State::Phase2Running) {
            LogRegistry::chain()->warn("[PhaseChain] start ignored: chain already running ({})", to_string(state_));
            return false;
        }

        previous = state_;
        previousDone = done_;
        state_ = State::Phase1Running;
        done_ = false;
    }

    try {
        // a terminal state is published from inside the runner's completion hook
        backup_.wait();
        cleanup_.wait();

        {
            std::scoped_lock lock(mutex_);
            cleanupRequested_ = plan.cleanupRequested;
            resolver_ = std::move(plan.resolveCleanup);
            cleanupExecutor_ = std::move(plan.cleanupExecutor);
        }

        cancelled_.store(false);
        transition_.rearm();

        LogRegistry::chain()->info("[PhaseChain] Starting backup of {} items (cleanup {})",
                                   plan.items.size(), plan.cleanupRequested ? "requested" : "not requested");

        if (backup_.start(std::move(plan.items), std::move(plan.executor))) return true;
    } catch (...) {
        restore(previous, previousDone);
        throw;
    }

    restore(previous, previousDone);
    return false;
}

void PhaseChain::cancel() {
    cancelled_.store(true);
    backup_.cancel();
    cleanup_.cancel();
}

PhaseChain::State PhaseChain::wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return done_ || state_ == State::Idle; });
    return state_;
}

void PhaseChain::handleBackupSettled(const Progress& p) {
    if (p.status() == Progress::Status::Running) {
        LogRegistry::chain()->warn("[PhaseChain] Ignoring backup completion for a run that is still in flight");
        return;
    }

    if (!transition_.tryTrigger()) {
        LogRegistry::chain()->debug("[PhaseChain] Duplicate backup completion ignored");
        return;
    }

    if (state() != State::Phase1Running) return;

    if (p.status() != Progress::Status::Completed || cancelled_.load()) {
        LogRegistry::chain()->warn("[PhaseChain] Backup did not complete ({} failed, cancelled: {}), skipping cleanup",
                                   p.failed_items, p.cancelled || cancelled_.load());
        transition(State::Phase1Failed, true);
        return;
    }

    if (!cleanupRequested_) {
        transition(State::Phase1Completed, true);
        return;
    }

    transition(State::Phase1Completed);

    std::vector<Item> items;
    try {
        items = resolver_();
    } catch (const std::exception& e) {
        LogRegistry::chain()->error("[PhaseChain] Failed to resolve cleanup set: {}", e.what());
        transition(State::Phase2Failed, true);
        return;
    }

    if (items.empty()) {
        LogRegistry::chain()->info("[PhaseChain] Nothing to free locally, skipping cleanup phase");
        transition(State::Phase1Completed, true);
        return;
    }

    if (cancelled_.load()) {
        transition(State::Phase1Completed, true);
        return;
    }

    LogRegistry::chain()->info("[PhaseChain] Backup complete, freeing {} local copies", items.size());
    transition(State::Phase2Running);

    if (!cleanup_.start(std::move(items), cleanupExecutor_)) {
        LogRegistry::chain()->error("[PhaseChain] Cleanup runner refused to start");
        transition(State::Phase2Failed, true);
        return;
    }

    // cancel() may have landed while cleanup_ was not yet running
    if (cancelled_.load()) cleanup_.cancel();
}

void PhaseChain::handleCleanupSettled(const Progress& p) {
    if (state() != State::Phase2Running) return;
    transition(p.status() == Progress::Status::Completed ? State::Phase2Completed : State::Phase2Failed, true);
}

PhaseChain::State PhaseChain::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

bool PhaseChain::isDone() const {
    std::scoped_lock lock(mutex_);
    return done_;
}

int PhaseChain::activePhase() const {
    const auto s = state();
    if (s == State::Idle) return 0;
    if (s == State::Phase2Running || s == State::Phase2Completed || s == State::Phase2Failed) return 2;
    return 1;
}

std::optional<Progress> PhaseChain::progress() const {
    return activePhase() == 2 ? cleanup_.progress() : backup_.progress();
}

void PhaseChain::subscribe(ProgressListener listener) {
    std::scoped_lock lock(listenerMutex_);
    progressListeners_.push_back(std::move(listener));
}

void PhaseChain::onStateChange(StateListener listener) {
    std::scoped_lock lock(listenerMutex_);
    stateListeners_.push_back(std::move(listener));
}

void PhaseChain::transition(const State next, const bool terminal) {
    {
        std::scoped_lock lock(mutex_);
        state_ = next;
        done_ = terminal;
    }

    LogRegistry::chain()->debug("[PhaseChain] -> {}", to_string(next));

    std::vector<StateListener> listeners;
    {
        std::scoped_lock lock(listenerMutex_);
        listeners = stateListeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(next);
        } catch (const std::exception& e) {
            LogRegistry::chain()->error("[PhaseChain] State listener threw: {}", e.what());
        }
    }

    cv_.notify_all();
}

void PhaseChain::restore(const State previous, const bool previousDone) {
    {
        std::scoped_lock lock(mutex_);
        state_ = previous;
        done_ = previousDone;
    }
    cv_.notify_all();
}

void PhaseChain::forward(const int phase, const Progress& p) {
    std::vector<ProgressListener> listeners;
    {
        std::scoped_lock lock(listenerMutex_);
        listeners = progressListeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(phase, p);
        } catch (const std::exception& e) {
            LogRegistry::chain()->error("[PhaseChain] Progress listener threw: {}", e.what());
        }
    }
}

std::string px::transfer::to_string(const PhaseChain::State state) {
    switch (state) {
        case PhaseChain::State::Idle: return "idle";
        case PhaseChain::State::Phase1Running: return "phase1_running";
        case PhaseChain::State::Phase1Completed: return "phase1_completed";
        case PhaseChain::State::Phase1Failed: return "phase1_failed";
        case PhaseChain::State::Phase2Running: return "phase2_running";
        case PhaseChain::State::Phase2Completed: return "phase2_completed";
        case PhaseChain::State::Phase2Failed: return "phase2_failed";
        default: return "unknown";
    }
}
