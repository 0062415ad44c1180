#include <gtest/gtest.h>
#include "transfer/RateEstimator.hpp"
#include "config/Config.hpp"

using namespace px::transfer;

TEST(RateEstimatorTest, NoRateUntilTwoSamples) {
    RateEstimator est;
    EXPECT_FALSE(est.rate().has_value());
    EXPECT_EQ(est.bytesPerSecond(), 0.0);

    est.sample(0.0, 0);
    EXPECT_FALSE(est.rate().has_value());
    EXPECT_FALSE(est.eta(1000).has_value());
}

TEST(RateEstimatorTest, FirstRateIsTakenAsIs) {
    RateEstimator est;
    est.sample(0.0, 0);
    est.sample(1.0, 100);

    ASSERT_TRUE(est.rate());
    EXPECT_DOUBLE_EQ(*est.rate(), 100.0);
}

TEST(RateEstimatorTest, LaterRatesAreSmoothed) {
    RateEstimator est;
    est.sample(0.0, 0);
    est.sample(1.0, 100);
    est.sample(2.0, 300);   // instantaneous 200 B/s

    EXPECT_DOUBLE_EQ(est.bytesPerSecond(), 0.3 * 200.0 + 0.7 * 100.0);
}

TEST(RateEstimatorTest, SmoothingOfOneTracksNewestRate) {
    RateEstimator est({ .window = 5, .smoothing = 1.0 });
    est.sample(0.0, 0);
    est.sample(1.0, 100);
    est.sample(2.0, 300);

    EXPECT_DOUBLE_EQ(est.bytesPerSecond(), 200.0);
}

TEST(RateEstimatorTest, SamplesWithoutNewBytesAreIgnored) {
    RateEstimator est;
    est.sample(0.0, 0);
    est.sample(1.0, 100);
    est.sample(2.0, 100);   // zero-byte item settled

    EXPECT_EQ(est.sampleCount(), 2u);
    EXPECT_DOUBLE_EQ(est.bytesPerSecond(), 100.0);
}

TEST(RateEstimatorTest, SameTimestampFallsBackToOlderSample) {
    RateEstimator est;
    est.sample(0.0, 0);
    est.sample(1.0, 100);
    est.sample(1.0, 200);   // compared against (0, 0): 200 B/s

    EXPECT_DOUBLE_EQ(est.bytesPerSecond(), 0.3 * 200.0 + 0.7 * 100.0);
}

TEST(RateEstimatorTest, AllSamplesAtSameInstantGiveNoRate) {
    RateEstimator est;
    est.sample(0.0, 0);
    est.sample(0.0, 100);

    EXPECT_FALSE(est.rate().has_value());
    EXPECT_FALSE(est.eta(100).has_value());
}

TEST(RateEstimatorTest, WindowIsBounded) {
    RateEstimator est({ .window = 3, .smoothing = 0.3 });
    for (int i = 0; i < 10; ++i) est.sample(i, static_cast<uint64_t>(i + 1) * 10);

    EXPECT_EQ(est.sampleCount(), 3u);
    EXPECT_DOUBLE_EQ(est.bytesPerSecond(), 10.0);
}

TEST(RateEstimatorTest, EtaIsRemainingOverRate) {
    RateEstimator est;
    est.sample(0.0, 0);
    est.sample(1.0, 100);

    const auto eta = est.eta(500);
    ASSERT_TRUE(eta);
    EXPECT_DOUBLE_EQ(*eta, 5.0);
    EXPECT_DOUBLE_EQ(*est.eta(0), 0.0);
}

TEST(RateEstimatorTest, ResetClearsHistory) {
    RateEstimator est;
    est.sample(0.0, 0);
    est.sample(1.0, 100);
    est.reset();

    EXPECT_EQ(est.sampleCount(), 0u);
    EXPECT_FALSE(est.rate().has_value());

    est.sample(0.0, 0);
    est.sample(2.0, 100);
    EXPECT_DOUBLE_EQ(est.bytesPerSecond(), 50.0);
}

TEST(RateEstimatorTest, InvalidOptionsThrow) {
    EXPECT_THROW(RateEstimator({ .window = 1, .smoothing = 0.3 }), std::invalid_argument);
    EXPECT_THROW(RateEstimator({ .window = 5, .smoothing = 0.0 }), std::invalid_argument);
    EXPECT_THROW(RateEstimator({ .window = 5, .smoothing = 1.5 }), std::invalid_argument);
}

TEST(RateEstimatorTest, OptionsFromConfig) {
    px::config::TransferConfig cfg;
    cfg.rate_window_samples = 8;
    cfg.rate_smoothing = 0.5;

    const auto opts = RateEstimator::Options::fromConfig(cfg);
    EXPECT_EQ(opts.window, 8u);
    EXPECT_DOUBLE_EQ(opts.smoothing, 0.5);
}
