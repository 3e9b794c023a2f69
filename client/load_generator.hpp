#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "request_issuer.hpp"

using Clock = std::chrono::steady_clock;

/**
 * @brief One attempted request.
 *
 * `duration` is wall-clock seconds spent in the call, whether it succeeded
 * or not. A transport failure or a non-2xx status is `success == false`.
 */
struct RequestSample {
    Clock::time_point start;
    double duration;
    bool success;
};

// Ordered by `start`, ascending.
using LoadResult = std::vector<RequestSample>;

/**
 * @brief Issues requests one after another until `deadline` has passed.
 *
 * The deadline is checked between requests only, so a run can overshoot it
 * by at most one request timeout. The request in flight at the deadline is
 * still recorded.
 */
LoadResult sequential_load(IRequestIssuer& issuer, const std::string& path, Clock::time_point deadline);

/**
 * @brief A way of driving load against one endpoint until a deadline.
 */
class ILoadStrategy {
public:
    virtual ~ILoadStrategy() = default;

    virtual LoadResult run(IRequestIssuer& issuer, const std::string& path, Clock::time_point deadline) = 0;

    virtual std::string name() const = 0;

    // Number of threads issuing requests.
    virtual int concurrency() const = 0;
};

class SequentialLoad : public ILoadStrategy {
public:
    LoadResult run(IRequestIssuer& issuer, const std::string& path, Clock::time_point deadline) override;
    std::string name() const override { return "sequential"; }
    int concurrency() const override { return 1; }
};

/**
 * @brief Runs `workers` sequential loops in parallel.
 *
 * Each worker gets its own clone of the issuer, and with it its own
 * connection. Workers share nothing while running; their samples are
 * concatenated after all of them joined and stably sorted by start time.
 */
class ConcurrentLoad : public ILoadStrategy {
    int workers_;
    std::vector<size_t> last_worker_counts_;

public:
    explicit ConcurrentLoad(int workers);

    LoadResult run(IRequestIssuer& issuer, const std::string& path, Clock::time_point deadline) override;
    std::string name() const override { return "concurrent"; }
    int concurrency() const override { return workers_; }

    // Samples produced by each worker during the last run().
    const std::vector<size_t>& last_worker_counts() const { return last_worker_counts_; }
};
