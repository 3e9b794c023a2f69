#include "load_generator.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <stdexcept>
#include <thread>

LoadResult sequential_load(IRequestIssuer& issuer, const std::string& path, Clock::time_point deadline) {
    LoadResult timings;
    while (true) {
        auto now = Clock::now();
        if (now > deadline) {
            break;
        }

        std::optional<HttpReply> reply = issuer.issue(path);

        double took = std::chrono::duration<double>(Clock::now() - now).count();
        timings.push_back(RequestSample{now, took, reply.has_value() && reply->ok()});
    }
    return timings;
}

LoadResult SequentialLoad::run(IRequestIssuer& issuer, const std::string& path, Clock::time_point deadline) {
    return sequential_load(issuer, path, deadline);
}

ConcurrentLoad::ConcurrentLoad(int workers) : workers_(workers) {
    if (workers_ < 1) {
        throw std::invalid_argument("ConcurrentLoad needs at least one worker");
    }
}

LoadResult ConcurrentLoad::run(IRequestIssuer& issuer, const std::string& path, Clock::time_point deadline) {
    // Clones are made up front; a failing clone leaves no thread behind.
    std::vector<std::unique_ptr<IRequestIssuer>> issuers;
    for (int i = 0; i < workers_; ++i) {
        issuers.push_back(issuer.clone());
    }

    std::vector<LoadResult> per_worker(workers_);
    std::vector<std::exception_ptr> failures(workers_);
    std::vector<std::thread> threads;
    try {
        for (int i = 0; i < workers_; ++i) {
            threads.emplace_back([&, i]() {
                try {
                    per_worker[i] = sequential_load(*issuers[i], path, deadline);
                } catch (...) {
                    failures[i] = std::current_exception();
                }
            });
        }
    } catch (...) {
        // Thread creation failed; the ones already running stop at the deadline.
        for (auto& t : threads) t.join();
        throw;
    }
    for (auto& t : threads) t.join();

    for (auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }

    last_worker_counts_.clear();
    LoadResult timings;
    for (auto& samples : per_worker) {
        last_worker_counts_.push_back(samples.size());
        timings.insert(timings.end(), samples.begin(), samples.end());
    }

    std::stable_sort(timings.begin(), timings.end(),
                     [](const RequestSample& a, const RequestSample& b) { return a.start < b.start; });
    return timings;
}
