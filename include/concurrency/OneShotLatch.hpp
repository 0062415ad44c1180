#pragma once

#include <atomic>

namespace px::concurrency {

// Lets exactly one caller through until rearmed.
class OneShotLatch {
public:
    // True for the first caller only
    [[nodiscard]] bool tryTrigger() { return !fired_.exchange(true); }

    [[nodiscard]] bool fired() const { return fired_.load(); }

    void rearm() { fired_.store(false); }

private:
    std::atomic<bool> fired_{false};
};

}
