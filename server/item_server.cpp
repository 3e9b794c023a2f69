#include "item_server.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <random>
#include <stdexcept>

#include <sys/socket.h>
#include <unistd.h>

namespace {

long long ReadIntegerEnv(const char* name, long long fallback)
{
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return fallback;
    }
    size_t used = 0;
    long long value = std::stoll(raw, &used);
    if (used != std::string(raw).size()) {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + raw);
    }
    return value;
}

double ReadFloatEnv(const char* name, double fallback)
{
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return fallback;
    }
    size_t used = 0;
    double value = std::stod(raw, &used);
    if (used != std::string(raw).size()) {
        throw std::invalid_argument(std::string(name) + " is not a number: " + raw);
    }
    return value;
}

std::mutex access_log_mutex;

}

ItemSettings ItemSettings::FromEnvironment()
{
    ItemSettings s;
    s.workers = static_cast<int>(std::max(1LL, ReadIntegerEnv(item_api::kEnvWorkers, item_api::kDefaultWorkers)));
    s.id_limit = std::max(0LL, ReadIntegerEnv(item_api::kEnvIdLimit, item_api::kDefaultIdLimit));
    s.max_delay = std::max(0.0, ReadFloatEnv(item_api::kEnvMaxDelay, item_api::kDefaultMaxDelay));
    return s;
}

ItemServer::ItemServer(const ItemSettings& item_settings, int thread_count):
    settings(item_settings)
{
    server.new_task_queue = [thread_count]{
        return new httplib::ThreadPool(thread_count, thread_count);
    };

    server.set_tcp_nodelay(true);

    // Every worker binds its own socket on the same port.
    server.set_socket_options([](socket_t sock) {
        int yes = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
        setsockopt(sock, SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes));
    });

    for (const char* endpoint : item_api::kEndpoints) {
        std::string pattern = std::string("/") + endpoint + "/(-?\\d+)";
        server.Get(pattern, [this](const httplib::Request &req, httplib::Response &res) {
            GetItem(req, res);
        });
    }

    server.set_logger([this](const httplib::Request &req, const httplib::Response &res) {
        LogAccess(req, res);
    });
}

void ItemServer::GetItem(const httplib::Request &req, httplib::Response &res)
{
    long long item_id = 0;
    try
    {
        item_id = std::stoll(req.matches[1].str());
    }
    catch (const std::out_of_range &)
    {
        // Too many digits for any configured limit.
        res.set_content(item_api::NotFoundBody(req.matches[1].str()), "application/json");
        res.status = 404;
        return;
    }

    if (item_id > settings.id_limit)
    {
        res.set_content(item_api::NotFoundBody(item_id), "application/json");
        res.status = 404; // Not Found
        return;
    }

    if (settings.max_delay > 0.0)
    {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<double> dist(0.0, settings.max_delay);
        auto delay = std::chrono::duration<double>(dist(gen));

        std::unique_lock<std::mutex> lock(stop_mutex);
        if (stop_cv.wait_for(lock, delay, [this] { return stopping; }))
        {
            res.set_content(item_api::OverloadedBody(), "application/json");
            res.status = 503; // Service Unavailable
            return;
        }
    }

    res.set_content(item_api::ItemBody(item_id), "application/json");
    res.status = 200; // OK
}

void ItemServer::LogAccess(const httplib::Request &req, const httplib::Response &res)
{
    char stamp[64];
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    std::strftime(stamp, sizeof(stamp), "%d/%b/%Y:%H:%M:%S %z", &local);

    std::string agent = req.get_header_value("User-Agent");
    if (agent.empty()) {
        agent = "-";
    }

    std::lock_guard<std::mutex> lock(access_log_mutex);
    std::cout << req.remote_addr << " - - [" << stamp << "] \""
              << req.method << " " << req.path << " " << req.version << "\" "
              << res.status << " " << res.body.size() << " \"-\" \"" << agent << "\""
              << std::endl;
}

bool ItemServer::Bind(const std::string& host, int port)
{
    if (!server.bind_to_port(host, port))
    {
        std::cerr << "Failed to bind " << host << ":" << port << std::endl;
        return false;
    }
    return true;
}

int ItemServer::ServeWorker()
{
    std::cerr << "Started server process [" << getpid() << "]" << std::endl;
    std::cerr << "Waiting for application startup." << std::endl;
    std::cerr << item_api::kReadyMarker << std::endl;

    bool clean = server.listen_after_bind();

    std::cerr << "Finished server process [" << getpid() << "]" << std::endl;
    return clean ? 0 : 1;
}

void ItemServer::WaitUntilReady()
{
    server.wait_until_ready();
}

void ItemServer::Stop()
{
    {
        std::lock_guard<std::mutex> lock(stop_mutex);
        stopping = true;
    }
    stop_cv.notify_all();
    server.stop();
}
