#include <iostream>
#include <string>
#include <memory>
#include <stdexcept>
#include <chrono>

#include "ItemApi.h"
#include "service_process.hpp"
#include "load_generator.hpp"
#include "performance.hpp"
#include "statistics.hpp"

#include "TestResults.hpp"
#include "utils.h"

namespace {

const char* kEndpointPath = "people/0";
const char* kResultsPath = "results.json";

}

int main(int argc, char* argv[]) {
    if (argc < 5 || argc > 7) {
        std::cerr << "Usage: " << argv[0]
                  << " <server_exe> <strategy> <duration_sec> <max_delay_sec> [workers] [id_limit]\n"
                  << "Strategies: sequential, concurrent (workers + 1 threads)\n"
                  << "Example: " << argv[0] << " ./item_server concurrent 60 0.01\n"
                  << "Example (4 service workers): " << argv[0] << " ./item_server sequential 30 0 4 10\n";
        return 1;
    }

    std::string server_exe;
    std::string strategy_name;
    double duration_sec;
    double max_delay_sec;
    int workers = 2;
    long long id_limit = 10;
    std::unique_ptr<ILoadStrategy> strategy;

    try {
        server_exe = argv[1];
        strategy_name = argv[2];
        duration_sec = std::stod(argv[3]);
        max_delay_sec = std::stod(argv[4]);
        if (argc >= 6) workers = std::stoi(argv[5]);
        if (argc == 7) id_limit = std::stoll(argv[6]);

        if (duration_sec <= 0 || max_delay_sec < 0 || workers < 1 || id_limit < 0) {
            throw std::invalid_argument("duration and workers must be positive, delay and id_limit non-negative.");
        }

        if (strategy_name == "sequential") {
            strategy = std::make_unique<SequentialLoad>();
        } else if (strategy_name == "concurrent") {
            strategy = std::make_unique<ConcurrentLoad>(workers + 1);
        } else {
            throw std::invalid_argument("Invalid strategy.");
        }
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return 1;
    }

    ServiceConfig config;
    config.executable = server_exe;
    config.expected_workers = workers;
    config.set_env(item_api::kEnvWorkers, static_cast<long long>(workers))
          .set_env(item_api::kEnvIdLimit, id_limit)
          .set_env(item_api::kEnvMaxDelay, max_delay_sec);

    TestResult tr;
    try {
        ServiceHandle service = acquire(config);
        auto issuer = service.request_issuer();

        tr = run_performance_test(*issuer, *strategy, kEndpointPath,
                                  std::chrono::duration<double>(duration_sec), max_delay_sec);
    } catch (const StartupTimeout& e) {
        std::cerr << "[Service] " << e.what() << "\n" << e.output();
        return 2;
    } catch (const InsufficientSamples& e) {
        std::cerr << "[Load] Not enough requests completed: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error during load test: " << e.what() << "\n";
        return 1;
    }

    try {
        append_result_to_file(tr, kResultsPath);
        std::cout << "Results written to '" << kResultsPath << "'\n";
    } catch (const std::exception& e) {
        std::cerr << "Error writing results: " << e.what() << "\n";
    }

    if (tr.errors != 0) {
        std::cerr << tr.errors << "/" << tr.requests << " requests failed\n";
        return 1;
    }
    return 0;
}
