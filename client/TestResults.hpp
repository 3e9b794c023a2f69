#pragma once
#include <string>

struct TestResult {
    std::string strategy;          // "sequential" or "concurrent"
    int threads;
    std::string endpoint;
    double duration_sec;           // requested duration
    double max_delay_sec;          // MAX_DELAY the service ran with
    long long requests;
    long long errors;
    double span_sec;               // first request start to last response
    double throughput;             // requests per second over span_sec
    double mean_response_ms;
    double stdev_response_ms;
};
