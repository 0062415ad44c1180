#include <gtest/gtest.h>
#include "transfer/PhaseChain.hpp"
#include "transfer/Planner.hpp"
#include "TestExecutors.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <thread>

using namespace px::transfer;
using namespace px::transfer::model;
using namespace px::test;
using namespace std::chrono_literals;

namespace {

// In-memory stand-in for the storage layer's view of where each blob lives.
class Membership {
public:
    void set(const std::string& id, const Location loc) {
        std::scoped_lock lock(mutex_);
        where_[id] = loc;
    }

    Location locate(const std::string& id) const {
        std::scoped_lock lock(mutex_);
        const auto it = where_.find(id);
        return it == where_.end() ? Location::Nowhere : it->second;
    }

    Locator locator() const {
        return [this](const std::string& id) { return locate(id); };
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Location> where_;
};

}

class PhaseChainTest : public ::testing::Test {
protected:
    Membership membership;

    std::mutex cleanupMutex;
    std::vector<std::string> cleanupCalls;

    std::mutex eventMutex;
    std::vector<PhaseChain::State> states;
    std::vector<int> phaseTags;

    // last, so its runners are joined before the state their listeners touch goes away
    PhaseChain chain;

    void SetUp() override {
        chain.onStateChange([this](const PhaseChain::State s) {
            std::scoped_lock lock(eventMutex);
            states.push_back(s);
        });
        chain.subscribe([this](const int phase, const Progress&) {
            std::scoped_lock lock(eventMutex);
            phaseTags.push_back(phase);
        });
    }

    std::shared_ptr<Executor> backupExecutor(const std::string& failId = {}) {
        return FunctionExecutor::blocking([this, failId](const Item& i) {
            if (i.id == failId) throw TransferError(Failure::Kind::Timeout, "upload timed out");
            membership.set(i.id, Location::Both);
        });
    }

    std::shared_ptr<Executor> cleanupExecutor() {
        return FunctionExecutor::blocking([this](const Item& i) {
            {
                std::scoped_lock lock(cleanupMutex);
                cleanupCalls.push_back(i.id);
            }
            membership.set(i.id, Location::BackupOnly);
        });
    }

    PhaseChain::Plan plan(std::vector<Item> toBackup, std::vector<Item> candidates, const bool cleanup = true,
                          const std::string& failId = {}) {
        return {
            .items = std::move(toBackup),
            .executor = backupExecutor(failId),
            .cleanupRequested = cleanup,
            .resolveCleanup = [this, candidates = std::move(candidates)] {
                return Planner::cleanup(candidates, membership.locator());
            },
            .cleanupExecutor = cleanupExecutor()
        };
    }

    std::vector<std::string> cleaned() {
        std::scoped_lock lock(cleanupMutex);
        return cleanupCalls;
    }
};

TEST_F(PhaseChainTest, BackupThenFreesLocalCopies) {
    const std::vector<Item> items = {item("a", 100), item("b", 200)};
    for (const auto& i : items) membership.set(i.id, Location::LocalOnly);

    ASSERT_TRUE(chain.start(plan(items, items)));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase2Completed);
    EXPECT_TRUE(chain.isDone());

    EXPECT_EQ(cleaned(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(membership.locate("a"), Location::BackupOnly);
    EXPECT_EQ(membership.locate("b"), Location::BackupOnly);

    std::scoped_lock lock(eventMutex);
    EXPECT_EQ(states, (std::vector<PhaseChain::State>{
        PhaseChain::State::Phase1Completed, PhaseChain::State::Phase2Running, PhaseChain::State::Phase2Completed}));
}

TEST_F(PhaseChainTest, ProgressIsTaggedByPhaseAndNeverMerged) {
    const std::vector<Item> items = {item("a", 100), item("b", 200)};
    for (const auto& i : items) membership.set(i.id, Location::LocalOnly);

    ASSERT_TRUE(chain.start(plan(items, items)));
    chain.wait();
    chain.cleanupRunner().wait();

    {
        std::scoped_lock lock(eventMutex);
        ASSERT_FALSE(phaseTags.empty());
        EXPECT_EQ(phaseTags.front(), 1);
        EXPECT_EQ(phaseTags.back(), 2);
        EXPECT_TRUE(std::is_sorted(phaseTags.begin(), phaseTags.end()));
    }

    EXPECT_EQ(chain.activePhase(), 2);
    const auto p = chain.progress();
    ASSERT_TRUE(p);
    EXPECT_EQ(p->operation, Operation::Cleanup);
    EXPECT_EQ(p->total_items, 2u);
    EXPECT_EQ(p->completed_items, 2u);
}

TEST_F(PhaseChainTest, RepeatedCompletionSignalsStartCleanupOnce) {
    // A second registration of the same completion handler, as a careless caller might add
    chain.backupRunner().onComplete([this](const Progress& p) { chain.handleBackupSettled(p); });

    const std::vector<Item> items = {item("a", 100), item("b", 200)};
    for (const auto& i : items) membership.set(i.id, Location::LocalOnly);

    ASSERT_TRUE(chain.start(plan(items, items)));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase2Completed);

    const auto finalBackup = chain.backupRunner().wait();
    ASSERT_TRUE(finalBackup);
    chain.handleBackupSettled(*finalBackup);
    chain.cleanupRunner().wait();

    const auto calls = cleaned();
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "a"), 1);
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "b"), 1);
    EXPECT_EQ(chain.state(), PhaseChain::State::Phase2Completed);
}

TEST_F(PhaseChainTest, CleanupOnlyFreesBlobsConfirmedInBackup) {
    const std::vector<Item> items = {item("a", 100), item("b", 200)};
    for (const auto& i : items) membership.set(i.id, Location::LocalOnly);
    membership.set("c", Location::LocalOnly);

    // "c" is offered as a cleanup candidate but never backed up
    ASSERT_TRUE(chain.start(plan(items, {item("a", 100), item("b", 200), item("c", 300)})));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase2Completed);

    EXPECT_EQ(cleaned(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(membership.locate("c"), Location::LocalOnly);
}

TEST_F(PhaseChainTest, BackupFailureSkipsCleanup) {
    const std::vector<Item> items = {item("a", 100), item("b", 200)};
    for (const auto& i : items) membership.set(i.id, Location::LocalOnly);

    ASSERT_TRUE(chain.start(plan(items, items, true, "b")));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase1Failed);
    EXPECT_TRUE(cleaned().empty());
    EXPECT_EQ(chain.activePhase(), 1);

    const auto p = chain.progress();
    ASSERT_TRUE(p);
    EXPECT_EQ(p->failed_items, 1u);
    EXPECT_EQ(p->errors, std::vector<std::string>{"upload timed out"});
}

TEST_F(PhaseChainTest, CleanupNotRequestedEndsAfterBackup) {
    const std::vector<Item> items = {item("a", 100)};
    membership.set("a", Location::LocalOnly);

    ASSERT_TRUE(chain.start(plan(items, items, false)));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase1Completed);
    EXPECT_TRUE(chain.isDone());
    EXPECT_TRUE(cleaned().empty());
    EXPECT_EQ(membership.locate("a"), Location::Both);
}

TEST_F(PhaseChainTest, EmptyCleanupSetShortCircuits) {
    const std::vector<Item> items = {item("a", 100)};
    membership.set("a", Location::LocalOnly);

    ASSERT_TRUE(chain.start(plan(items, {})));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase1Completed);
    EXPECT_TRUE(chain.isDone());
    EXPECT_TRUE(cleaned().empty());
    EXPECT_FALSE(chain.cleanupRunner().progress().has_value());
}

TEST_F(PhaseChainTest, FreeOnlyRunSkipsStraightToCleanup) {
    membership.set("a", Location::Both);
    membership.set("b", Location::Both);
    membership.set("c", Location::LocalOnly);

    ASSERT_TRUE(chain.start(plan({}, {item("a", 100), item("b", 200), item("c", 300)})));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase2Completed);
    EXPECT_EQ(cleaned(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(PhaseChainTest, ResolverFailureEndsInPhase2Failed) {
    membership.set("a", Location::LocalOnly);

    auto p = plan({item("a", 100)}, {});
    p.resolveCleanup = []() -> std::vector<Item> { throw std::runtime_error("index unavailable"); };

    ASSERT_TRUE(chain.start(std::move(p)));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase2Failed);
    EXPECT_TRUE(cleaned().empty());
}

TEST_F(PhaseChainTest, CleanupFailureEndsInPhase2Failed) {
    const std::vector<Item> items = {item("a", 100), item("b", 200)};
    for (const auto& i : items) membership.set(i.id, Location::LocalOnly);

    auto p = plan(items, items);
    p.cleanupExecutor = FunctionExecutor::blocking([](const Item& i) {
        if (i.id == "b") throw TransferError(Failure::Kind::NotFound, "local copy already gone");
    });

    ASSERT_TRUE(chain.start(std::move(p)));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase2Failed);
}

TEST_F(PhaseChainTest, CancelDuringBackupSkipsCleanup) {
    const std::vector<Item> items = {item("a", 100), item("b", 200)};
    const auto gated = std::make_shared<GatedExecutor>();

    auto p = plan(items, items);
    p.executor = gated;
    ASSERT_TRUE(chain.start(std::move(p)));

    ASSERT_TRUE(gated->waitForCalls(1));
    chain.cancel();
    gated->resolve("a");

    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase1Failed);
    EXPECT_TRUE(cleaned().empty());
    EXPECT_EQ(gated->calls(), std::vector<std::string>{"a"});
}

TEST_F(PhaseChainTest, StartWhileRunningIsRejected) {
    const auto gated = std::make_shared<GatedExecutor>();
    auto first = plan({item("a", 100)}, {});
    first.executor = gated;
    ASSERT_TRUE(chain.start(std::move(first)));
    ASSERT_TRUE(gated->waitForCalls(1));

    EXPECT_FALSE(chain.start(plan({item("x", 1)}, {})));
    EXPECT_EQ(chain.state(), PhaseChain::State::Phase1Running);

    gated->resolve("a");
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase1Completed);
    EXPECT_EQ(gated->calls(), std::vector<std::string>{"a"});
}

TEST_F(PhaseChainTest, CanBeRestartedAfterTerminalState) {
    membership.set("a", Location::LocalOnly);
    ASSERT_TRUE(chain.start(plan({item("a", 100)}, {}, false)));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase1Completed);

    membership.set("b", Location::LocalOnly);
    ASSERT_TRUE(chain.start(plan({item("b", 50)}, {item("a", 100), item("b", 50)})));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase2Completed);
    EXPECT_EQ(cleaned(), (std::vector<std::string>{"a", "b"}));
}

TEST(PhaseChainPlanTest, CleanupWithoutResolverIsRejected) {
    PhaseChain chain;
    PhaseChain::Plan p;
    p.executor = std::make_shared<ScriptedExecutor>();
    p.cleanupRequested = true;
    EXPECT_THROW(chain.start(std::move(p)), std::invalid_argument);
    EXPECT_EQ(chain.state(), PhaseChain::State::Idle);
}

TEST(PhaseChainStateTest, StateNames) {
    EXPECT_EQ(to_string(PhaseChain::State::Idle), "idle");
    EXPECT_EQ(to_string(PhaseChain::State::Phase2Failed), "phase2_failed");
}

TEST_F(PhaseChainTest, ConcurrentStartsClaimTheChainOnce) {
    const auto gated = std::make_shared<GatedExecutor>();
    std::atomic<int> accepted{0};

    const auto attempt = [&] {
        auto p = plan({item("a", 100)}, {}, false);
        p.executor = gated;
        if (chain.start(std::move(p))) ++accepted;
    };

    std::thread first(attempt), second(attempt);
    first.join();
    second.join();

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(chain.state(), PhaseChain::State::Phase1Running);

    ASSERT_TRUE(gated->waitForCalls(1));
    gated->resolve("a");
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase1Completed);
    EXPECT_EQ(gated->calls(), std::vector<std::string>{"a"});
}

TEST_F(PhaseChainTest, CancelAtCleanupHandoffStopsCleanup) {
    const std::vector<Item> items = {item("a", 100), item("b", 200), item("c", 300)};
    for (const auto& i : items) membership.set(i.id, Location::LocalOnly);

    // lands after the chain committed to phase 2 but before the cleanup runner is live
    chain.onStateChange([this](const PhaseChain::State s) {
        if (s == PhaseChain::State::Phase2Running) chain.cancel();
    });

    auto p = plan(items, items);
    p.cleanupExecutor = FunctionExecutor::blocking([this](const Item& i) {
        {
            std::scoped_lock lock(cleanupMutex);
            cleanupCalls.push_back(i.id);
        }
        std::this_thread::sleep_for(50ms);
    });

    ASSERT_TRUE(chain.start(std::move(p)));
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase2Failed);
    EXPECT_LE(cleaned().size(), 1u);

    const auto cleanup = chain.cleanupRunner().wait();
    ASSERT_TRUE(cleanup);
    EXPECT_TRUE(cleanup->cancelled);
}

TEST(PhaseChainRestartTest, RefusedStartKeepsPreviousState) {
    PhaseChain chain(Runner::Options{ .duplicates = Runner::DuplicatePolicy::Reject });
    const auto exec = std::make_shared<ScriptedExecutor>();

    ASSERT_TRUE(chain.start({ .items = {item("a", 1)}, .executor = exec }));
    ASSERT_EQ(chain.wait(), PhaseChain::State::Phase1Completed);

    EXPECT_FALSE(chain.start({ .items = {item("b", 1), item("b", 1)}, .executor = exec }));
    EXPECT_EQ(chain.state(), PhaseChain::State::Phase1Completed);
    EXPECT_TRUE(chain.isDone());
    EXPECT_EQ(chain.wait(), PhaseChain::State::Phase1Completed);
    EXPECT_EQ(exec->callCount("b"), 0u);
}
