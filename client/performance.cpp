#include "performance.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include "visualizer.hpp"

TestResult run_performance_test(IRequestIssuer& issuer, ILoadStrategy& strategy,
                                const std::string& path, std::chrono::duration<double> duration,
                                double max_delay_sec, LoadResult* samples_out) {
    auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(duration);

    std::cout << "[Load] The test will now continuously send GET requests to '" << path << "' for "
              << duration.count() << " seconds (" << strategy.name() << ", "
              << strategy.concurrency() << " threads)..." << std::endl;

    LoadResult timings = strategy.run(issuer, path, deadline);
    LoadSummary summary = summarize(timings);

    std::ostringstream report;
    report << std::fixed
           << "[Load] Made " << summary.count << " requests in " << std::setprecision(2) << summary.span
           << " seconds\n"
           << "[Load] " << summary.failed << " requests got error responses\n"
           << "[Load] Arithmetic mean of response times: " << std::setprecision(5) << summary.mean_latency << "\n"
           << "[Load] Standard deviation of response times: " << summary.stdev_latency << "\n"
           << visualize_requests(timings);
    std::cout << report.str() << std::endl;

    TestResult result;
    result.strategy = strategy.name();
    result.threads = strategy.concurrency();
    result.endpoint = path;
    result.duration_sec = duration.count();
    result.max_delay_sec = max_delay_sec;
    result.requests = static_cast<long long>(summary.count);
    result.errors = static_cast<long long>(summary.failed);
    result.span_sec = summary.span;
    result.throughput = summary.span > 0.0 ? static_cast<double>(summary.count) / summary.span : 0.0;
    result.mean_response_ms = summary.mean_latency * 1000.0;
    result.stdev_response_ms = summary.stdev_latency * 1000.0;

    if (samples_out != nullptr) {
        *samples_out = std::move(timings);
    }
    return result;
}
