#pragma once

#include <httplib.h>

#include <condition_variable>
#include <mutex>
#include <string>

#include "ItemApi.h"

/**
 * @brief Runtime knobs of the item service, read from the environment.
 */
struct ItemSettings
{
    int workers = item_api::kDefaultWorkers;
    long long id_limit = item_api::kDefaultIdLimit;
    double max_delay = item_api::kDefaultMaxDelay;

    // Throws std::invalid_argument when a variable is set but not a number.
    static ItemSettings FromEnvironment();
};

class ItemServer
{
    httplib::Server server;
    ItemSettings settings;

    std::mutex stop_mutex;
    std::condition_variable stop_cv;
    bool stopping = false;

    void LogAccess(const httplib::Request &req, const httplib::Response &res);

public:
    ItemServer(const ItemSettings& item_settings, int thread_count=8);

    void GetItem(const httplib::Request &req, httplib::Response &res);

    // Binds and starts listening; connections queue until ServeWorker runs.
    bool Bind(const std::string& host, int port);

    // Accept loop on the socket opened by Bind. Returns once Stop is called.
    int ServeWorker();

    void WaitUntilReady();

    void Stop();
};
