#include <gtest/gtest.h>

#include <chrono>

#include "statistics.hpp"

namespace {

RequestSample at(Clock::time_point origin, double offset_sec, double duration, bool success) {
    auto start = origin + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(offset_sec));
    return RequestSample{start, duration, success};
}

}

TEST(Statistics, SummarizesKnownSamples) {
    auto t0 = Clock::now();
    LoadResult samples{at(t0, 0.0, 0.1, true), at(t0, 0.1, 0.2, true), at(t0, 0.3, 0.3, false)};

    LoadSummary summary = summarize(samples);
    EXPECT_EQ(summary.count, 3u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_NEAR(summary.mean_latency, 0.2, 1e-9);
    EXPECT_NEAR(summary.stdev_latency, 0.1, 1e-9);
    EXPECT_NEAR(summary.span, 0.6, 1e-6);
}

TEST(Statistics, StdevUsesSampleFormula) {
    // Population stdev would be 2.0; the n-1 form gives sqrt(32/7).
    std::vector<double> values{2, 4, 4, 4, 5, 5, 7, 9};
    EXPECT_NEAR(mean(values), 5.0, 1e-12);
    EXPECT_NEAR(sample_stdev(values), 2.138089935, 1e-9);
}

TEST(Statistics, RejectsTooFewSamples) {
    LoadResult none;
    EXPECT_THROW(summarize(none), InsufficientSamples);

    LoadResult one{RequestSample{Clock::now(), 0.01, true}};
    EXPECT_THROW(summarize(one), InsufficientSamples);

    EXPECT_THROW(mean({}), InsufficientSamples);
    EXPECT_THROW(sample_stdev({1.0}), InsufficientSamples);
}

TEST(Statistics, IdenticalLatenciesHaveZeroSpread) {
    auto t0 = Clock::now();
    LoadResult samples{at(t0, 0.0, 0.05, true), at(t0, 0.05, 0.05, true)};
    LoadSummary summary = summarize(samples);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_DOUBLE_EQ(summary.stdev_latency, 0.0);
}
