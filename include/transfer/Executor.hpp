#pragma once

#include "transfer/model/Item.hpp"
#include "transfer/model/Outcome.hpp"

#include <functional>
#include <future>
#include <memory>

namespace px::transfer {

// Performs one item's transfer. The engine does not care what the call does.
struct Executor {
    virtual ~Executor() = default;

    // Must eventually settle. Throwing (directly or through the future) counts as a failed item.
    virtual std::future<model::Outcome> execute(const model::Item& item) = 0;

    // Best-effort interrupt of the in-flight call. Must not block.
    virtual void cancel() {}
};

class FunctionExecutor final : public Executor {
public:
    using AsyncFn = std::function<std::future<model::Outcome>(const model::Item&)>;
    using SyncFn = std::function<void(const model::Item&)>;
    using CancelFn = std::function<void()>;

    explicit FunctionExecutor(AsyncFn fn, CancelFn onCancel = {});

    // Runs fn inline; an exception thrown by fn becomes the item's failure
    static std::shared_ptr<FunctionExecutor> blocking(SyncFn fn, CancelFn onCancel = {});

    std::future<model::Outcome> execute(const model::Item& item) override;
    void cancel() override;

private:
    AsyncFn fn_;
    CancelFn onCancel_;
};

}
