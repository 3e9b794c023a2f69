#pragma once

#include <chrono>
#include <string>

#include "TestResults.hpp"
#include "load_generator.hpp"
#include "statistics.hpp"

/**
 * @brief Drives `strategy` against `path` for `duration`, logs the
 * summary and the per-second chart, and returns the figures.
 * `max_delay_sec` is the service's configured delay, recorded as given.
 *
 * @throws InsufficientSamples when fewer than two requests were made.
 */
TestResult run_performance_test(IRequestIssuer& issuer, ILoadStrategy& strategy,
                                const std::string& path, std::chrono::duration<double> duration,
                                double max_delay_sec, LoadResult* samples_out = nullptr);
