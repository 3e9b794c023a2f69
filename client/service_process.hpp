#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/types.h>

#include "ItemApi.h"
#include "request_issuer.hpp"

/**
 * @brief How to launch the service under test.
 *
 * In `args` the token "{port}" is replaced with the allocated port and
 * "{bind}" with "0.0.0.0:<port>".
 */
struct ServiceConfig {
    std::string executable;
    std::vector<std::string> args{"--bind", "{bind}"};

    // Merged over the harness's own environment.
    std::map<std::string, std::string> env;

    int expected_workers = 1;
    std::string ready_marker = item_api::kReadyMarker;
    std::chrono::milliseconds startup_timeout{10000};
    std::chrono::milliseconds shutdown_grace{10000};

    // Host the request issuers connect to.
    std::string host = "localhost";

    ServiceConfig& set_env(const std::string& key, const std::string& value);
    ServiceConfig& set_env(const std::string& key, long long value);
    ServiceConfig& set_env(const std::string& key, double value);
};

/**
 * @brief The service never printed enough readiness lines in time.
 */
class StartupTimeout : public std::runtime_error {
    std::string output_;

public:
    StartupTimeout(const std::string& what, std::string output)
        : std::runtime_error(what), output_(std::move(output)) {}

    // Everything the service wrote before it was given up on.
    const std::string& output() const { return output_; }
};

struct ShutdownReport {
    int exit_status = -1;
    bool forced_kill = false;
    std::vector<std::string> error_log;   // stderr, as captured
    std::vector<std::string> access_log;  // stdout, repeated lines collapsed
};

class ServiceHandle;

/**
 * @brief Allocates a free port, launches the service and blocks until
 * `expected_workers` readiness lines have been seen on its stderr.
 *
 * @throws StartupTimeout when readiness is not reached within
 *         `startup_timeout` or the process exits first. The process is
 *         killed and reaped before the exception leaves.
 * @throws std::system_error when pipes, fork or the free-port lookup fail.
 */
ServiceHandle acquire(const ServiceConfig& config);

// Binds port 0 on all interfaces and returns what the kernel picked.
int find_free_port();

/**
 * @brief Exclusive owner of one running service process.
 *
 * Move-only. Destruction releases the process if release() was not called,
 * so a failing caller can never leak it.
 */
class ServiceHandle {
public:
    ServiceHandle();
    ~ServiceHandle();

    ServiceHandle(const ServiceHandle&) = delete;
    ServiceHandle& operator=(const ServiceHandle&) = delete;

    ServiceHandle(ServiceHandle&& other) noexcept;
    ServiceHandle& operator=(ServiceHandle&& other) noexcept;

    bool running() const;
    pid_t pid() const;
    int port() const;
    const std::string& host() const;
    const std::map<std::string, std::string>& environment() const;

    // Copy of the stderr lines captured so far.
    std::vector<std::string> error_output() const;

    /**
     * @brief A request issuer bound to this service's port.
     * Must not outlive the handle in any meaningful way: once released,
     * every request simply fails.
     */
    std::unique_ptr<IRequestIssuer> request_issuer(
        std::chrono::milliseconds timeout = HttpRequestIssuer::kDefaultTimeout) const;

    /**
     * @brief SIGINT, wait up to `shutdown_grace`, then SIGKILL the whole
     * process group. Drains both output streams and logs them.
     *
     * Safe to call more than once; later calls return an empty report.
     */
    ShutdownReport release();

private:
    struct State;
    std::unique_ptr<State> state_;

    explicit ServiceHandle(std::unique_ptr<State> state);
    friend ServiceHandle acquire(const ServiceConfig& config);
};
