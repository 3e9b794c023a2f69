#pragma once

#include "httplib.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

/**
 * @brief What the harness keeps from an HTTP response.
 */
struct HttpReply {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Issues GET requests against one service endpoint.
 *
 * A failed transport (timeout, refused or reset connection) is reported as
 * an empty optional, never as an exception, so the caller can record it as
 * a failed sample and carry on.
 */
class IRequestIssuer {
public:
    virtual ~IRequestIssuer() = default;

    /**
     * @param path    Path relative to the service root, e.g. "people/0".
     * @param headers Extra request headers.
     */
    virtual std::optional<HttpReply> issue(const std::string& path, const httplib::Headers& headers) = 0;

    std::optional<HttpReply> issue(const std::string& path) { return issue(path, httplib::Headers{}); }

    /**
     * @brief Creates an independent issuer for the same endpoint.
     * Each load worker gets its own clone and with it its own connection.
     */
    virtual std::unique_ptr<IRequestIssuer> clone() const = 0;
};

/**
 * @brief IRequestIssuer over a persistent httplib::Client connection.
 */
class HttpRequestIssuer : public IRequestIssuer {
    std::string host_;
    int port_;
    std::chrono::milliseconds timeout_;
    httplib::Client cli_;

public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{1000};

    HttpRequestIssuer(const std::string& host, int port,
                      std::chrono::milliseconds timeout = kDefaultTimeout);

    using IRequestIssuer::issue;
    std::optional<HttpReply> issue(const std::string& path, const httplib::Headers& headers) override;

    std::unique_ptr<IRequestIssuer> clone() const override;

    const std::string& host() const { return host_; }
    int port() const { return port_; }
};
