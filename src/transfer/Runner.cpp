#include "transfer/Runner.hpp"
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "util/format.hpp"

#include <numeric>
#include <stdexcept>
#include <unordered_set>

using namespace px::transfer;
using namespace px::transfer::model;
using namespace px::logging;
using namespace px::util;

namespace {

bool hasDuplicateIds(const std::vector<Item>& items) {
    std::unordered_set<std::string> seen;
    for (const auto& item : items)
        if (!seen.insert(item.id).second) return true;
    return false;
}

}

Runner::Options Runner::Options::fromConfig(const config::TransferConfig& cfg) {
    return {
        .rate = RateEstimator::Options::fromConfig(cfg),
        .duplicates = cfg.reject_duplicate_ids ? DuplicatePolicy::Reject : DuplicatePolicy::Process
    };
}

Runner::Options Runner::Options::fromRegistry() {
    if (!config::ConfigRegistry::isInitialized()) return {};
    return fromConfig(config::ConfigRegistry::get().transfer);
}

Runner::Runner(const Operation operation) : Runner(operation, Options::fromRegistry()) {}

Runner::Runner(const Operation operation, Options opts)
    : operation_(operation), opts_(opts), rate_(opts.rate) {}

Runner::~Runner() {
    cancel();
    joinWorker();
}

bool Runner::start(std::vector<Item> items, std::shared_ptr<Executor> executor) {
    if (!executor) throw std::invalid_argument("Runner::start: null executor");

    if (opts_.duplicates == DuplicatePolicy::Reject && hasDuplicateIds(items)) {
        LogRegistry::transfer()->warn("[Runner] {} start rejected: duplicate item ids in batch", to_string(operation_));
        return false;
    }

    if (!claimRun("start")) return false;

    auto previous = save();
    try {
        Progress p;
        p.operation = operation_;
        p.total_items = items.size();
        const auto totalBytes = std::accumulate(items.begin(), items.end(), uint64_t{0},
                                        [](const uint64_t sum, const Item& i) { return sum + i.size_bytes; });
        p.total_bytes = totalBytes;
        p.items.reserve(items.size());
        for (const auto& item : items) p.items.push_back({ .item = item });
        if (!items.empty()) p.current_item = items.front();

        std::vector<std::size_t> queue(items.size());
        std::iota(queue.begin(), queue.end(), std::size_t{0});

        {
            std::scoped_lock lock(mutex_);
            items_ = std::make_shared<const std::vector<Item>>(std::move(items));
            executor_ = std::move(executor);
            progress_ = std::move(p);
            rate_.reset();
            runBytes_ = 0;
            skippedByCancel_ = false;
            startedAt_ = Clock::now();
            rate_.sample(0.0, 0);
        }

        LogRegistry::transfer()->debug("[Runner] {} run started: {} items, {}",
                                       to_string(operation_), queue.size(), formatBytes(totalBytes));
        launch(std::move(queue));
    } catch (...) {
        releaseClaim(std::move(previous));
        throw;
    }

    return true;
}

bool Runner::retryFailed(std::shared_ptr<Executor> executor) {
    if (!executor) throw std::invalid_argument("Runner::retryFailed: null executor");
    if (!claimRun("retryFailed")) return false;

    auto previous = save();
    std::vector<std::size_t> queue;

    try {
        std::scoped_lock lock(mutex_);

        if (progress_ && progress_->canRetry()) {
            auto& p = *progress_;
            for (std::size_t i = 0; i < p.items.size(); ++i) {
                auto& st = p.items[i];
                if (st.status != ItemState::Status::Failed) continue;
                st.status = ItemState::Status::Pending;
                st.error.reset();
                queue.push_back(i);
            }

            // items the cancelled run never reached stay pending through the retry
            skippedByCancel_ = p.cancelled;

            p.failed_items = 0;
            p.errors.clear();
            p.finished = false;
            p.cancelled = false;
            p.current_item = (*items_)[queue.front()];
            p.eta_seconds.reset();
            p.bytes_per_second = 0.0;
            p.elapsed_seconds = 0.0;

            executor_ = std::move(executor);
            rate_.reset();
            runBytes_ = 0;
            startedAt_ = Clock::now();
            rate_.sample(0.0, 0);
        }
    } catch (...) {
        releaseClaim(std::move(previous));
        throw;
    }

    if (queue.empty()) {
        releaseClaim(std::move(previous));
        LogRegistry::transfer()->warn("[Runner] {} retryFailed ignored: no resumable failures", to_string(operation_));
        return false;
    }

    try {
        LogRegistry::transfer()->info("[Runner] {} retrying {} failed items", to_string(operation_), queue.size());
        launch(std::move(queue));
    } catch (...) {
        releaseClaim(std::move(previous));
        throw;
    }

    return true;
}

void Runner::cancel() {
    if (!running_.load()) return;
    if (cancelRequested_.exchange(true)) return;

    std::shared_ptr<Executor> exec;
    {
        std::scoped_lock lock(mutex_);
        exec = executor_;
    }

    LogRegistry::transfer()->info("[Runner] {} cancel requested, in-flight item will settle first",
                                  to_string(operation_));
    if (exec) exec->cancel();
}

void Runner::reset() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        LogRegistry::transfer()->warn("[Runner] {} reset ignored: run still active", to_string(operation_));
        return;
    }

    joinWorker();

    {
        std::scoped_lock lock(mutex_);
        progress_.reset();
        items_.reset();
        executor_.reset();
        rate_.reset();
        runBytes_ = 0;
        skippedByCancel_ = false;
    }

    cancelRequested_.store(false);
    running_.store(false);
}

std::optional<Progress> Runner::wait() {
    if (workerId_.load() == std::this_thread::get_id())
        throw std::logic_error("Runner::wait called from the runner's own worker thread");

    std::unique_lock lock(mutex_);
    done_cv_.wait(lock, [this] { return !running_.load(); });
    return progress_;
}

std::optional<Progress> Runner::progress() const {
    std::scoped_lock lock(mutex_);
    auto p = progress_;
    if (p && !p->finished)
        p->elapsed_seconds = std::chrono::duration<double>(Clock::now() - startedAt_).count();
    return p;
}

void Runner::subscribe(ProgressListener listener) {
    std::scoped_lock lock(listenerMutex_);
    progressListeners_.push_back(std::move(listener));
}

void Runner::onItemSettled(ItemListener listener) {
    std::scoped_lock lock(listenerMutex_);
    itemListeners_.push_back(std::move(listener));
}

void Runner::onComplete(ProgressListener listener) {
    std::scoped_lock lock(listenerMutex_);
    completeListeners_.push_back(std::move(listener));
}

bool Runner::claimRun(const char* caller) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        LogRegistry::transfer()->warn("[Runner] {} {} ignored: a run is already active", to_string(operation_), caller);
        return false;
    }

    try {
        joinWorker();
    } catch (...) {
        running_.store(false);
        done_cv_.notify_all();
        throw;
    }

    cancelRequested_.store(false);
    return true;
}

Runner::Saved Runner::save() const {
    std::scoped_lock lock(mutex_);
    return { .progress = progress_, .items = items_, .skippedByCancel = skippedByCancel_ };
}

// Undoes a claimed start/retryFailed that never reached its worker thread
void Runner::releaseClaim(Saved previous) {
    {
        std::scoped_lock lock(mutex_);
        progress_ = std::move(previous.progress);
        items_ = std::move(previous.items);
        skippedByCancel_ = previous.skippedByCancel;
        executor_.reset();
        running_.store(false);
    }
    done_cv_.notify_all();
}

void Runner::launch(std::vector<std::size_t> queue) {
    worker_ = std::thread([this, queue = std::move(queue)] {
        workerId_.store(std::this_thread::get_id());
        try {
            runLoop(queue);
        } catch (const std::exception& e) {
            LogRegistry::transfer()->error("[Runner] {} run aborted: {}", to_string(operation_), e.what());
            finish(cancelRequested_.load());
        }
        workerId_.store(std::thread::id{});
    });
}

void Runner::runLoop(const std::vector<std::size_t>& queue) {
    if (queue.empty()) {
        finish(false);
        return;
    }

    if (const auto initial = progress()) publish(*initial);

    for (std::size_t pos = 0; pos < queue.size(); ++pos) {
        if (cancelRequested_.load()) {
            finish(true);
            return;
        }

        const auto idx = queue[pos];
        const auto& item = (*items_)[idx];

        {
            std::scoped_lock lock(mutex_);
            progress_->items[idx].status = ItemState::Status::InProgress;
            progress_->current_item = item;
        }

        const auto outcome = settle(item);
        const bool fatal = !outcome.ok() && outcome.failure->isFatal();
        const bool more = pos + 1 < queue.size();
        const bool cancelled = more && !fatal && cancelRequested_.load();

        std::optional<std::size_t> next;
        if (more && !fatal && !cancelled) next = queue[pos + 1];

        record(idx, outcome, next, cancelled);

        if (fatal) {
            LogRegistry::transfer()->error("[Runner] {} halted on fatal failure for {}: {}",
                                           to_string(operation_), item.display_name, outcome.failure->message);
        }

        if (!next) break;
    }

    complete();
}

Outcome Runner::settle(const Item& item) {
    std::shared_ptr<Executor> exec;
    {
        std::scoped_lock lock(mutex_);
        exec = executor_;
    }

    try {
        auto fut = exec->execute(item);
        if (!fut.valid()) return Outcome::failed(Failure::Kind::Transient, "executor returned no result");
        return fut.get();
    } catch (const TransferError& e) {
        return Outcome::failed(e.kind(), e.what());
    } catch (const std::exception& e) {
        return Outcome::failed(Failure::Kind::Transient, e.what());
    } catch (...) {
        return Outcome::failed(Failure::Kind::Transient, "unknown error");
    }
}

void Runner::record(const std::size_t index, const Outcome& outcome,
                    const std::optional<std::size_t> next, const bool cancelled) {
    Progress snapshot;
    Item item;

    {
        std::scoped_lock lock(mutex_);
        auto& p = *progress_;
        auto& st = p.items[index];
        item = st.item;

        if (outcome.ok()) {
            st.status = ItemState::Status::Completed;
            st.bytes_transferred = st.item.size_bytes;
            ++p.completed_items;
            p.transferred_bytes += st.item.size_bytes;
            runBytes_ += st.item.size_bytes;
        } else {
            const auto& failure = *outcome.failure;
            const auto message = failure.message.empty() ? failure.kindToString() : failure.message;
            st.status = ItemState::Status::Failed;
            st.error = message;
            ++p.failed_items;
            p.errors.push_back(message);
            if (failure.isFatal()) p.can_resume = false;
        }

        const double elapsed = std::chrono::duration<double>(Clock::now() - startedAt_).count();
        rate_.sample(elapsed, runBytes_);
        p.elapsed_seconds = elapsed;
        p.bytes_per_second = rate_.bytesPerSecond();

        if (next) {
            p.current_item = (*items_)[*next];
            p.eta_seconds = rate_.eta(p.total_bytes - p.transferred_bytes);
        } else {
            p.current_item.reset();
            p.eta_seconds.reset();
            p.finished = true;
            p.cancelled = cancelled || skippedByCancel_;
        }

        snapshot = p;
    }

    if (!outcome.ok()) {
        LogRegistry::transfer()->warn("[Runner] {} failed for {} ({}): {}", to_string(operation_),
                                      item.display_name, outcome.failure->kindToString(), outcome.failure->message);
    }

    publish(snapshot);
    notifyItem(item, outcome);
}

void Runner::finish(const bool cancelled) {
    Progress snapshot;
    {
        std::scoped_lock lock(mutex_);
        if (!progress_) return;
        auto& p = *progress_;
        p.finished = true;
        p.cancelled = (cancelled && p.settledItems() < p.total_items) || skippedByCancel_;
        p.current_item.reset();
        p.eta_seconds.reset();
        p.elapsed_seconds = std::chrono::duration<double>(Clock::now() - startedAt_).count();
        for (auto& st : p.items)
            if (st.status == ItemState::Status::InProgress) st.status = ItemState::Status::Pending;
        snapshot = p;
    }

    publish(snapshot);
    complete();
}

void Runner::complete() {
    const auto snapshot = progress();

    if (snapshot) {
        const auto& p = *snapshot;
        const auto log = LogRegistry::transfer();
        if (p.cancelled)
            log->info("[Runner] {} cancelled after {}/{} items ({})", to_string(operation_),
                      p.settledItems(), p.total_items, formatBytes(p.transferred_bytes));
        else if (p.status() == Progress::Status::Completed)
            log->info("[Runner] {} completed: {} items, {} in {}", to_string(operation_),
                      p.completed_items, formatBytes(p.transferred_bytes), formatDuration(p.elapsed_seconds));
        else
            log->warn("[Runner] {} finished with {} failed of {} items (resumable: {})", to_string(operation_),
                      p.failed_items, p.total_items, p.can_resume);

        std::vector<ProgressListener> listeners;
        {
            std::scoped_lock lock(listenerMutex_);
            listeners = completeListeners_;
        }
        for (const auto& listener : listeners) invoke(listener, p);
    }

    {
        std::scoped_lock lock(mutex_);
        executor_.reset();
        running_.store(false);
    }
    done_cv_.notify_all();
}

void Runner::publish(const Progress& snapshot) {
    std::vector<ProgressListener> listeners;
    {
        std::scoped_lock lock(listenerMutex_);
        listeners = progressListeners_;
    }
    for (const auto& listener : listeners) invoke(listener, snapshot);
}

void Runner::notifyItem(const Item& item, const Outcome& outcome) {
    std::vector<ItemListener> listeners;
    {
        std::scoped_lock lock(listenerMutex_);
        listeners = itemListeners_;
    }

    for (const auto& listener : listeners) {
        try {
            listener(item, outcome);
        } catch (const std::exception& e) {
            LogRegistry::transfer()->error("[Runner] Item listener threw: {}", e.what());
        }
    }
}

void Runner::invoke(const ProgressListener& listener, const Progress& snapshot) {
    try {
        listener(snapshot);
    } catch (const std::exception& e) {
        LogRegistry::transfer()->error("[Runner] Progress listener threw: {}", e.what());
    }
}

void Runner::joinWorker() {
    if (!worker_.joinable()) return;
    if (worker_.get_id() == std::this_thread::get_id()) worker_.detach();
    else worker_.join();
}
