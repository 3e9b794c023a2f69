#include <string>
#include <iostream>
#include <thread>
#include <vector>
#include <stdexcept>

#include <csignal>
#include <pthread.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "ItemApi.h"
#include "item_server.hpp"

namespace {

bool ParseBind(const std::string& bind, std::string& host, int& port)
{
    auto colon = bind.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    host = bind.substr(0, colon);
    try {
        port = std::stoi(bind.substr(colon + 1));
    } catch (const std::exception&) {
        return false;
    }
    return port > 0 && port < 65536;
}

/**
 * @brief Body of one forked worker process.
 *
 * SIGINT/SIGTERM arrive blocked (inherited mask) and are picked up by a
 * dedicated thread with sigwait, which stops the accept loop.
 */
int RunWorker(const ItemSettings& settings, const std::string& host, int port)
{
    // Follow the master down if it is killed outright.
    prctl(PR_SET_PDEATHSIG, SIGTERM);

    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);

    ItemServer svr(settings);
    if (!svr.Bind(host, port)) {
        return 1;
    }

    std::thread waiter([&svr, stop_signals]() {
        svr.WaitUntilReady();
        int sig = 0;
        sigwait(&stop_signals, &sig);
        std::cerr << "Shutting down" << std::endl;
        svr.Stop();
    });

    int rc = svr.ServeWorker();

    // Wakes the waiter when the accept loop ended without a signal.
    kill(getpid(), SIGTERM);
    waiter.join();
    return rc;
}

}

int main(int argc, char* argv[])
{
    if (argc != 3 || std::string(argv[1]) != "--bind") {
        std::cerr << "Usage: " << argv[0] << " --bind <host>:<port>\n"
                  << "Environment: " << item_api::kEnvWorkers << ", "
                  << item_api::kEnvIdLimit << ", " << item_api::kEnvMaxDelay << "\n";
        return 1;
    }

    std::string host;
    int port = 0;
    if (!ParseBind(argv[2], host, port)) {
        std::cerr << "Invalid bind address: " << argv[2] << std::endl;
        return 1;
    }

    ItemSettings settings;
    try {
        settings = ItemSettings::FromEnvironment();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);

    // Blocked before forking so neither master nor workers can miss one.
    sigset_t master_signals;
    sigemptyset(&master_signals);
    sigaddset(&master_signals, SIGINT);
    sigaddset(&master_signals, SIGTERM);
    sigaddset(&master_signals, SIGCHLD);
    pthread_sigmask(SIG_BLOCK, &master_signals, nullptr);

    std::cerr << "Listening at: http://" << host << ":" << port << " (" << getpid() << ")" << std::endl;
    std::cerr << "Using worker count: " << settings.workers
              << " (item limit " << settings.id_limit
              << ", max delay " << settings.max_delay << "s)" << std::endl;

    std::vector<pid_t> workers;
    for (int i = 0; i < settings.workers; ++i) {
        std::cout.flush();
        pid_t pid = fork();
        if (pid < 0) {
            std::cerr << "fork() failed for worker " << i << std::endl;
            break;
        }
        if (pid == 0) {
            std::exit(RunWorker(settings, host, port));
        }
        std::cerr << "Booting worker with pid: " << pid << std::endl;
        workers.push_back(pid);
    }

    size_t alive = workers.size();
    bool failed = alive != static_cast<size_t>(settings.workers);
    if (failed) {
        for (pid_t pid : workers) kill(pid, SIGTERM);
    }

    while (alive > 0) {
        int sig = 0;
        sigwait(&master_signals, &sig);

        if (sig == SIGINT || sig == SIGTERM) {
            std::cerr << "Handling signal: " << (sig == SIGINT ? "int" : "term") << std::endl;
            for (pid_t pid : workers) kill(pid, sig);
            continue;
        }

        int status = 0;
        pid_t done;
        while (alive > 0 && (done = waitpid(-1, &status, WNOHANG)) > 0) {
            --alive;
            if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
                failed = true;
            }
            std::cerr << "Worker exiting (pid: " << done << ")" << std::endl;
        }
    }

    std::cerr << "Shutting down: Master" << std::endl;
    return failed ? 1 : 0;
}
