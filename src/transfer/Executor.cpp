#include "transfer/Executor.hpp"

#include <stdexcept>

using namespace px::transfer;
using namespace px::transfer::model;

FunctionExecutor::FunctionExecutor(AsyncFn fn, CancelFn onCancel)
    : fn_(std::move(fn)), onCancel_(std::move(onCancel)) {
    if (!fn_) throw std::invalid_argument("FunctionExecutor: empty execute function");
}

std::shared_ptr<FunctionExecutor> FunctionExecutor::blocking(SyncFn fn, CancelFn onCancel) {
    if (!fn) throw std::invalid_argument("FunctionExecutor: empty execute function");

    return std::make_shared<FunctionExecutor>(
        [fn = std::move(fn)](const Item& item) {
            std::promise<Outcome> promise;
            try {
                fn(item);
                promise.set_value(Outcome::success());
            } catch (...) {
                promise.set_exception(std::current_exception());
            }
            return promise.get_future();
        },
        std::move(onCancel));
}

std::future<Outcome> FunctionExecutor::execute(const Item& item) { return fn_(item); }

void FunctionExecutor::cancel() {
    if (onCancel_) onCancel_();
}
