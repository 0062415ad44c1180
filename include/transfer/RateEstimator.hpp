#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace px::config { struct TransferConfig; }

namespace px::transfer {

/**
 * Smooths cumulative (elapsed, bytes) samples into a bytes/sec figure.
 *
 * The instantaneous rate is taken between the newest sample and the newest
 * older sample with a strictly smaller timestamp, then blended into the
 * running value with weight `smoothing`. A sample that adds no bytes is an
 * instantaneous item and leaves the rate untouched.
 */
class RateEstimator {
public:
    struct Options {
        std::size_t window = 5;
        double smoothing = 0.3;

        static Options fromConfig(const config::TransferConfig& cfg);
    };

    RateEstimator() : RateEstimator(Options{}) {}
    explicit RateEstimator(Options opts);

    void sample(double elapsedSeconds, uint64_t cumulativeBytes);
    void reset();

    // Empty until two samples with distinct timestamps and a byte delta exist
    [[nodiscard]] std::optional<double> rate() const { return smoothed_; }
    [[nodiscard]] double bytesPerSecond() const { return smoothed_.value_or(0.0); }
    [[nodiscard]] std::optional<double> eta(uint64_t remainingBytes) const;

    [[nodiscard]] std::size_t sampleCount() const { return window_.size(); }
    [[nodiscard]] const Options& options() const { return opts_; }

private:
    struct Sample {
        double elapsed;
        uint64_t bytes;
    };

    Options opts_;
    std::deque<Sample> window_;
    std::optional<double> smoothed_;
};

}
