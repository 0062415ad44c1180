#include "transfer/RateEstimator.hpp"
#include "config/Config.hpp"

#include <stdexcept>

using namespace px::transfer;

RateEstimator::Options RateEstimator::Options::fromConfig(const config::TransferConfig& cfg) {
    return { .window = cfg.rate_window_samples, .smoothing = cfg.rate_smoothing };
}

RateEstimator::RateEstimator(Options opts) : opts_(opts) {
    if (opts_.window < 2) throw std::invalid_argument("RateEstimator: window must hold at least 2 samples");
    if (!(opts_.smoothing > 0.0 && opts_.smoothing <= 1.0))
        throw std::invalid_argument("RateEstimator: smoothing must be in (0, 1]");
}

void RateEstimator::sample(const double elapsedSeconds, const uint64_t cumulativeBytes) {
    if (!window_.empty() && cumulativeBytes <= window_.back().bytes) return;

    window_.push_back({elapsedSeconds, cumulativeBytes});
    while (window_.size() > opts_.window) window_.pop_front();
    if (window_.size() < 2) return;

    const auto& newest = window_.back();
    for (auto it = window_.rbegin() + 1; it != window_.rend(); ++it) {
        const double dt = newest.elapsed - it->elapsed;
        if (dt <= 0.0) continue;

        const double instant = static_cast<double>(newest.bytes - it->bytes) / dt;
        smoothed_ = smoothed_ ? opts_.smoothing * instant + (1.0 - opts_.smoothing) * *smoothed_ : instant;
        return;
    }
}

void RateEstimator::reset() {
    window_.clear();
    smoothed_.reset();
}

std::optional<double> RateEstimator::eta(const uint64_t remainingBytes) const {
    if (!smoothed_ || *smoothed_ <= 0.0) return std::nullopt;
    return static_cast<double>(remainingBytes) / *smoothed_;
}
