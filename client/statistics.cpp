#include "statistics.hpp"

#include <cmath>
#include <string>

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        throw InsufficientSamples("mean requires at least one data point");
    }
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

double sample_stdev(const std::vector<double>& values) {
    if (values.size() < 2) {
        throw InsufficientSamples("standard deviation requires at least two data points, got " +
                                  std::to_string(values.size()));
    }
    double m = mean(values);
    double squares = 0.0;
    for (double v : values) squares += (v - m) * (v - m);
    return std::sqrt(squares / static_cast<double>(values.size() - 1));
}

LoadSummary summarize(const LoadResult& samples) {
    std::vector<double> latencies;
    latencies.reserve(samples.size());

    LoadSummary summary;
    for (const auto& sample : samples) {
        latencies.push_back(sample.duration);
        if (!sample.success) summary.failed++;
    }
    summary.count = samples.size();
    summary.stdev_latency = sample_stdev(latencies);
    summary.mean_latency = mean(latencies);

    const auto& last = samples.back();
    summary.span = std::chrono::duration<double>(last.start - samples.front().start).count() + last.duration;
    return summary;
}
