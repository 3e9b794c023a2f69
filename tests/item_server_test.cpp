#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "ItemApi.h"
#include "load_generator.hpp"
#include "performance.hpp"
#include "service_process.hpp"
#include "statistics.hpp"

namespace {

const long long kIdLimit = 10;
const int kServerWorkers = 2;

class ItemServerTest : public ::testing::Test {
protected:
    ServiceHandle service;

    void start(double max_delay) {
        ServiceConfig config;
        config.executable = ITEM_SERVER_PATH;
        config.expected_workers = kServerWorkers;
        config.set_env(item_api::kEnvWorkers, static_cast<long long>(kServerWorkers))
              .set_env(item_api::kEnvIdLimit, kIdLimit)
              .set_env(item_api::kEnvMaxDelay, max_delay);
        service = acquire(config);
    }
};

// Returns the number of mismatches; the failures themselves are reported.
int check_endpoint(IRequestIssuer& issuer, const std::string& endpoint) {
    int mismatches = 0;

    auto bare = issuer.issue(endpoint);
    if (!bare || bare->status != 404) {
        ADD_FAILURE() << endpoint << " without id: expected 404";
        ++mismatches;
    }

    for (long long id = 0; id <= kIdLimit; ++id) {
        auto reply = issuer.issue(endpoint + "/" + std::to_string(id));
        if (!reply || reply->status != 200 || reply->body != item_api::ItemBody(id)) {
            ADD_FAILURE() << endpoint << "/" << id << ": expected 200 " << item_api::ItemBody(id)
                          << ", got " << (reply ? std::to_string(reply->status) + " " + reply->body : "timeout");
            ++mismatches;
        }
    }

    auto beyond = issuer.issue(endpoint + "/" + std::to_string(kIdLimit + 1));
    if (!beyond || beyond->status != 404 || beyond->body != item_api::NotFoundBody(kIdLimit + 1)) {
        ADD_FAILURE() << endpoint << "/" << kIdLimit + 1 << ": expected 404 "
                      << item_api::NotFoundBody(kIdLimit + 1);
        ++mismatches;
    }
    return mismatches;
}

}

TEST_F(ItemServerTest, EndpointsAnswerUpToTheLimit) {
    start(0.0);
    auto issuer = service.request_issuer();
    for (const char* endpoint : item_api::kEndpoints) {
        EXPECT_EQ(check_endpoint(*issuer, endpoint), 0) << endpoint;
    }
}

TEST_F(ItemServerTest, EndpointsAnswerTheSameUnderConcurrency) {
    start(0.0);
    auto issuer = service.request_issuer();

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kServerWorkers + 1; ++i) {
        threads.emplace_back([&mismatches, clone = issuer->clone()]() {
            for (const char* endpoint : item_api::kEndpoints) {
                mismatches += check_endpoint(*clone, endpoint);
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(ItemServerTest, SequentialRunHasNoFailures) {
    start(0.0);
    auto issuer = service.request_issuer();
    SequentialLoad strategy;

    auto started = Clock::now();
    LoadResult samples;
    TestResult result =
        run_performance_test(*issuer, strategy, "people/0", std::chrono::seconds(2), 0.0, &samples);
    auto elapsed = Clock::now() - started;

    EXPECT_EQ(result.errors, 0);
    EXPECT_GT(result.requests, 1);
    EXPECT_EQ(result.requests, static_cast<long long>(samples.size()));
    // Overshoot is bounded by one request timeout.
    EXPECT_LT(elapsed, std::chrono::seconds(2) + HttpRequestIssuer::kDefaultTimeout + std::chrono::milliseconds(200));
}

TEST_F(ItemServerTest, ConcurrentRunWithDelayHasNoFailures) {
    start(0.01);
    auto issuer = service.request_issuer();
    ConcurrentLoad strategy(kServerWorkers + 1);

    LoadResult samples;
    TestResult result =
        run_performance_test(*issuer, strategy, "people/0", std::chrono::seconds(2), 0.01, &samples);

    EXPECT_EQ(result.errors, 0);
    EXPECT_EQ(result.threads, kServerWorkers + 1);
    EXPECT_DOUBLE_EQ(result.max_delay_sec, 0.01);
    EXPECT_LT(result.mean_response_ms, 100.0);
    ASSERT_EQ(strategy.last_worker_counts().size(), static_cast<size_t>(kServerWorkers + 1));
    size_t total = 0;
    for (size_t count : strategy.last_worker_counts()) total += count;
    EXPECT_EQ(samples.size(), total);
}

TEST_F(ItemServerTest, NegativeIdsAreWithinTheLimit) {
    start(0.0);
    auto issuer = service.request_issuer();
    for (const char* endpoint : item_api::kEndpoints) {
        auto reply = issuer->issue(std::string(endpoint) + "/-1");
        ASSERT_TRUE(reply.has_value()) << endpoint;
        EXPECT_EQ(reply->status, 200) << endpoint;
        EXPECT_EQ(reply->body, item_api::ItemBody(-1)) << endpoint;
    }
}

TEST_F(ItemServerTest, OversizedIdIsNamedInTheNotFoundDetail) {
    start(0.0);
    auto issuer = service.request_issuer();
    const std::string huge = "1234567890123456789012345";

    auto reply = issuer->issue("people/" + huge);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->status, 404);
    EXPECT_EQ(reply->body, item_api::NotFoundBody(huge));
    EXPECT_EQ(reply->body, "{\"detail\": \"Item " + huge + " was not found.\"}");
}

TEST_F(ItemServerTest, EveryWorkerRunsItsOwnProcess) {
    start(0.0);
    std::set<std::string> started;
    for (const auto& line : service.error_output()) {
        if (line.find("Started server process [") != std::string::npos) started.insert(line);
    }
    EXPECT_EQ(started.size(), static_cast<size_t>(kServerWorkers));

    auto issuer = service.request_issuer();
    for (int i = 0; i < 20; ++i) {
        auto reply = issuer->clone()->issue("planets/3");
        ASSERT_TRUE(reply.has_value());
        EXPECT_EQ(reply->status, 200);
    }
}

TEST_F(ItemServerTest, DelayedRequestIsRefusedOnShutdown) {
    // The random delay is practically always longer than the test.
    start(1000.0);
    auto issuer = service.request_issuer(std::chrono::seconds(10));

    std::optional<HttpReply> reply;
    std::thread pending([&reply, &issuer]() { reply = issuer->issue("people/0"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto started = Clock::now();
    ShutdownReport report = service.release();
    pending.join();

    EXPECT_FALSE(report.forced_kill);
    EXPECT_LT(Clock::now() - started, std::chrono::seconds(5));
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->status, 503);
    EXPECT_EQ(reply->body, item_api::OverloadedBody());
}

TEST(ItemServerConfig, RejectsNonNumericLimit) {
    ServiceConfig config;
    config.executable = ITEM_SERVER_PATH;
    config.set_env(item_api::kEnvIdLimit, std::string("lots"));
    EXPECT_THROW(acquire(config), StartupTimeout);
}
