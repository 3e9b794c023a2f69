#pragma once

#include <stdexcept>
#include <vector>

#include "load_generator.hpp"

/**
 * @brief Too few values for the requested statistic (mean needs one,
 * standard deviation needs two).
 */
class InsufficientSamples : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

struct LoadSummary {
    size_t count = 0;
    size_t failed = 0;
    double mean_latency = 0.0;   // seconds
    double stdev_latency = 0.0;  // seconds, sample (n-1) standard deviation
    double span = 0.0;           // first start to last completion, seconds
};

double mean(const std::vector<double>& values);

// Unbiased sample standard deviation.
double sample_stdev(const std::vector<double>& values);

/**
 * @throws InsufficientSamples when `samples` holds fewer than two entries.
 */
LoadSummary summarize(const LoadResult& samples);
