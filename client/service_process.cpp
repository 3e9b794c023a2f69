#include "service_process.hpp"
#include "ordered_set.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

#include <arpa/inet.h>
#include <csignal>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

using Clock = std::chrono::steady_clock;

std::system_error os_error(const std::string& what) {
    return std::system_error(errno, std::generic_category(), what);
}

/**
 * @brief Line splitter over the read end of a non-blocking pipe.
 */
struct PipeLines {
    int fd = -1;
    std::string pending;
    bool eof = false;

    void read_available(std::vector<std::string>& out) {
        char buf[4096];
        while (true) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) {
                pending.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
            eof = true;
            break;
        }

        size_t start = 0;
        size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            out.emplace_back(pending, start, newline - start);
            start = newline + 1;
        }
        pending.erase(0, start);

        if (eof && !pending.empty()) {
            out.push_back(pending);
            pending.clear();
        }
    }

    void close_fd() {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

std::string expand_arg(std::string arg, int port) {
    const std::pair<std::string, std::string> tokens[] = {
        {"{bind}", "0.0.0.0:" + std::to_string(port)},
        {"{port}", std::to_string(port)},
    };
    for (const auto& token : tokens) {
        size_t at;
        while ((at = arg.find(token.first)) != std::string::npos) {
            arg.replace(at, token.first.size(), token.second);
        }
    }
    return arg;
}

// The harness's own environment with `overrides` applied on top.
std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        size_t eq = kv.find('=');
        if (eq == std::string::npos) continue;
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& kv : overrides) {
        merged[kv.first] = kv.second;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& kv : merged) {
        result.push_back(kv.first + "=" + kv.second);
    }
    return result;
}

std::string describe_env(const std::map<std::string, std::string>& env) {
    std::ostringstream ss;
    ss << "{";
    bool first = true;
    for (const auto& kv : env) {
        ss << (first ? "" : ", ") << kv.first << "=" << kv.second;
        first = false;
    }
    ss << "}";
    return ss.str();
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (const auto& line : lines) {
        joined += line;
        joined += '\n';
    }
    return joined;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}

ServiceConfig& ServiceConfig::set_env(const std::string& key, const std::string& value) {
    env[key] = value;
    return *this;
}

ServiceConfig& ServiceConfig::set_env(const std::string& key, long long value) {
    return set_env(key, std::to_string(value));
}

ServiceConfig& ServiceConfig::set_env(const std::string& key, double value) {
    std::ostringstream ss;
    ss << value;
    return set_env(key, ss.str());
}

struct ServiceHandle::State {
    pid_t pid = -1;
    int port = 0;
    std::string host;
    std::map<std::string, std::string> env;
    std::chrono::milliseconds shutdown_grace{10000};

    bool reaped = false;
    int exit_status = -1;

    PipeLines out;
    PipeLines err;

    mutable std::mutex mutex;
    std::vector<std::string> error_lines;
    std::vector<std::string> access_lines;

    std::thread reader;
    std::atomic<bool> draining{false};

    ~State() {
        stop_reader();
        out.close_fd();
        err.close_fd();
    }

    // Waits up to timeout_ms for output. Returns true if anything was read.
    bool poll_streams(int timeout_ms, std::vector<std::string>& new_errors, std::vector<std::string>& new_output) {
        pollfd fds[2];
        PipeLines* pipes[2];
        nfds_t count = 0;
        for (PipeLines* p : {&err, &out}) {
            if (p->eof) continue;
            fds[count] = pollfd{p->fd, POLLIN, 0};
            pipes[count] = p;
            ++count;
        }
        if (count == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            return false;
        }

        int ready = ::poll(fds, count, timeout_ms);
        if (ready <= 0) {
            return false;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            pipes[i]->read_available(pipes[i] == &err ? new_errors : new_output);
        }
        return true;
    }

    void record(std::vector<std::string>& new_errors, std::vector<std::string>& new_output) {
        if (new_errors.empty() && new_output.empty()) return;
        std::lock_guard<std::mutex> lock(mutex);
        error_lines.insert(error_lines.end(), new_errors.begin(), new_errors.end());
        access_lines.insert(access_lines.end(), new_output.begin(), new_output.end());
    }

    // Keeps both pipes empty so the service never blocks on a write.
    void reader_loop() {
        while (!(out.eof && err.eof)) {
            std::vector<std::string> new_errors;
            std::vector<std::string> new_output;
            bool got = poll_streams(50, new_errors, new_output);
            record(new_errors, new_output);
            // Process is gone and the pipes went quiet.
            if (!got && draining.load()) break;
        }
    }

    void stop_reader() {
        draining.store(true);
        if (reader.joinable()) reader.join();
    }

    // Exit check that leaves the zombie in place. An unreaped leader keeps
    // its process group id from being handed to anyone else.
    bool has_exited() {
        if (reaped) return true;
        siginfo_t info{};
        if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
            return errno == ECHILD;
        }
        return info.si_pid == pid;
    }

    bool wait_for_exit(std::chrono::milliseconds timeout) {
        auto start = Clock::now();
        while (Clock::now() - start < timeout) {
            if (has_exited()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        return has_exited();
    }

    // SIGKILLs whatever is left of the process group, then reaps the leader.
    void kill_now() {
        if (reaped) return;
        // Negative pid: the service and every worker it forked.
        ::kill(-pid, SIGKILL);
        int status = 0;
        pid_t result;
        do {
            result = ::waitpid(pid, &status, 0);
        } while (result < 0 && errno == EINTR);
        if (result == pid) exit_status = decode_status(status);
        reaped = true;
    }

    std::string captured_output() const {
        std::lock_guard<std::mutex> lock(mutex);
        return join_lines(error_lines) + join_lines(access_lines);
    }

    void wait_until_ready(const ServiceConfig& config);
};

void ServiceHandle::State::wait_until_ready(const ServiceConfig& config) {
    auto deadline = Clock::now() + config.startup_timeout;
    int workers_ready = 0;

    while (workers_ready < config.expected_workers) {
        auto now = Clock::now();
        if (now > deadline) {
            kill_now();
            throw StartupTimeout("Service did not fully start within " +
                                     std::to_string(config.startup_timeout.count()) + " ms (" +
                                     std::to_string(workers_ready) + "/" +
                                     std::to_string(config.expected_workers) + " workers ready)",
                                 captured_output());
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = static_cast<int>(std::min<long long>(100, std::max<long long>(1, remaining)));

        std::vector<std::string> new_errors;
        std::vector<std::string> new_output;
        poll_streams(wait_ms, new_errors, new_output);
        for (const auto& line : new_errors) {
            if (line.find(config.ready_marker) != std::string::npos) {
                ++workers_ready;
            }
        }
        record(new_errors, new_output);

        if (workers_ready < config.expected_workers && has_exited()) {
            // Pick up whatever it wrote on the way out.
            new_errors.clear();
            new_output.clear();
            err.read_available(new_errors);
            out.read_available(new_output);
            record(new_errors, new_output);
            kill_now();
            throw StartupTimeout("Service exited with status " + std::to_string(exit_status) +
                                     " before becoming ready",
                                 captured_output());
        }
    }
}

int find_free_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) throw os_error("socket");

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto error = os_error("bind");
        ::close(fd);
        throw error;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        auto error = os_error("getsockname");
        ::close(fd);
        throw error;
    }
    ::close(fd);
    return ntohs(addr.sin_port);
}

ServiceHandle acquire(const ServiceConfig& config) {
    if (config.executable.empty()) {
        throw std::invalid_argument("ServiceConfig.executable is empty");
    }

    int port = find_free_port();

    // Everything the child needs is built before fork.
    std::vector<std::string> arg_strings{config.executable};
    for (const auto& arg : config.args) {
        arg_strings.push_back(expand_arg(arg, port));
    }
    std::vector<std::string> env_strings = merged_environment(config.env);

    std::vector<char*> argv;
    for (auto& arg : arg_strings) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& kv : env_strings) envp.push_back(const_cast<char*>(kv.c_str()));
    envp.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) throw os_error("pipe2");
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto error = os_error("pipe2");
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw error;
    }

    std::cout << "[Service] Starting " << config.executable << " on " << config.host << ":" << port
              << " with settings: " << describe_env(config.env) << std::endl;

    pid_t pid = ::fork();
    if (pid < 0) {
        auto error = os_error("fork");
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        throw error;
    }

    if (pid == 0) {
        // Own process group, so a forced kill reaches its workers too.
        ::setpgid(0, 0);
        ::prctl(PR_SET_PDEATHSIG, SIGTERM);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    // Also done by the child; whichever runs first wins.
    ::setpgid(pid, pid);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    auto state = std::make_unique<ServiceHandle::State>();
    state->pid = pid;
    state->port = port;
    state->host = config.host;
    state->env = config.env;
    state->shutdown_grace = config.shutdown_grace;
    state->out.fd = out_pipe[0];
    state->err.fd = err_pipe[0];

    // Kills and reaps the child itself before throwing.
    state->wait_until_ready(config);

    ServiceHandle::State* raw = state.get();
    state->reader = std::thread([raw] { raw->reader_loop(); });

    std::cout << "[Service] Started successfully (pid " << pid << ", "
              << config.expected_workers << " workers ready)" << std::endl;
    return ServiceHandle(std::move(state));
}

ServiceHandle::ServiceHandle() = default;

ServiceHandle::ServiceHandle(std::unique_ptr<State> state) : state_(std::move(state)) {}

ServiceHandle::~ServiceHandle() {
    if (!state_) return;
    try {
        release();
    } catch (const std::exception& e) {
        std::cerr << "[Service] Error while stopping service: " << e.what() << std::endl;
    }
}

ServiceHandle::ServiceHandle(ServiceHandle&& other) noexcept : state_(std::move(other.state_)) {}

ServiceHandle& ServiceHandle::operator=(ServiceHandle&& other) noexcept {
    if (this != &other) {
        if (state_) {
            try {
                release();
            } catch (const std::exception& e) {
                std::cerr << "[Service] Error while stopping service: " << e.what() << std::endl;
            }
        }
        state_ = std::move(other.state_);
    }
    return *this;
}

bool ServiceHandle::running() const {
    return state_ != nullptr;
}

pid_t ServiceHandle::pid() const {
    return state_ ? state_->pid : -1;
}

int ServiceHandle::port() const {
    return state_ ? state_->port : 0;
}

const std::string& ServiceHandle::host() const {
    static const std::string none;
    return state_ ? state_->host : none;
}

const std::map<std::string, std::string>& ServiceHandle::environment() const {
    static const std::map<std::string, std::string> none;
    return state_ ? state_->env : none;
}

std::vector<std::string> ServiceHandle::error_output() const {
    if (!state_) return {};
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->error_lines;
}

std::unique_ptr<IRequestIssuer> ServiceHandle::request_issuer(std::chrono::milliseconds timeout) const {
    if (!state_) {
        throw std::logic_error("request_issuer() on a released service handle");
    }
    return std::make_unique<HttpRequestIssuer>(state_->host, state_->port, timeout);
}

ShutdownReport ServiceHandle::release() {
    ShutdownReport report;
    if (!state_) return report;

    // Leaves the handle empty even if something below throws.
    std::unique_ptr<State> state = std::move(state_);

    std::cout << "[Service] Stopping service (pid " << state->pid << ")..." << std::endl;
    if (!state->reaped) {
        ::kill(state->pid, SIGINT);
        if (!state->wait_for_exit(state->shutdown_grace)) {
            std::cerr << "[Service] Warning: service did not exit within "
                      << state->shutdown_grace.count() << " ms of SIGINT, killing it" << std::endl;
            report.forced_kill = true;
        }
        // Also sweeps workers that outlived a clean leader exit.
        state->kill_now();
    }
    state->stop_reader();

    report.exit_status = state->exit_status;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        report.error_log = state->error_lines;
        report.access_log = OrderedSet<std::string>(state->access_lines.begin(), state->access_lines.end()).to_vector();
    }

    std::cout << "[Service] Stopped service (exit status " << report.exit_status << ")" << std::endl;
    std::cout << "[Service] Error log from the service:\n" << join_lines(report.error_log);
    std::cout << "[Service] Unique entries from access log of the service:\n" << join_lines(report.access_log)
              << std::flush;
    return report;
}
