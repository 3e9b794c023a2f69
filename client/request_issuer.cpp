#include "request_issuer.hpp"

HttpRequestIssuer::HttpRequestIssuer(const std::string& host, int port, std::chrono::milliseconds timeout)
    : host_(host), port_(port), timeout_(timeout), cli_(host, port) {
    cli_.set_keep_alive(true);
    cli_.set_tcp_nodelay(true);
    cli_.set_connection_timeout(timeout_);
    cli_.set_read_timeout(timeout_);
    cli_.set_write_timeout(timeout_);
}

std::optional<HttpReply> HttpRequestIssuer::issue(const std::string& path, const httplib::Headers& headers) {
    std::string target = (!path.empty() && path.front() == '/') ? path : "/" + path;

    httplib::Result res = cli_.Get(target, headers);
    if (!res) {
        return std::nullopt;
    }
    return HttpReply{res->status, res->body};
}

std::unique_ptr<IRequestIssuer> HttpRequestIssuer::clone() const {
    return std::make_unique<HttpRequestIssuer>(host_, port_, timeout_);
}
