#pragma once

#include <curl/curl.h>

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace nonkyc {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct RequestTimings {
    double connect_ms = 0.0;
    double app_connect_ms = 0.0;
    double start_transfer_ms = 0.0;
    double total_ms = 0.0;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    // Header names are lower-cased.
    std::map<std::string, std::string> headers;
    RequestTimings timings;

    [[nodiscard]] std::string header(const std::string& name) const;
};

// Raised when no HTTP status was received at all (DNS, connect, TLS, timeout,
// connection reset). HTTP error statuses are returned, not thrown.
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message, bool timed_out = false)
        : std::runtime_error(message), timed_out_(timed_out) {}

    [[nodiscard]] bool timed_out() const noexcept { return timed_out_; }

private:
    bool timed_out_;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse request(
        const std::string& method,
        const std::string& url,
        const HttpHeaders& headers = {},
        const std::string& body = "") = 0;
};

struct HttpClientOptions {
    long timeout_ms = 10000;
    long connect_timeout_ms = 3000;
};

class HttpClient : public HttpTransport {
public:
    explicit HttpClient(HttpClientOptions options = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept = delete;
    HttpClient& operator=(HttpClient&&) noexcept = delete;

    HttpResponse request(
        const std::string& method,
        const std::string& url,
        const HttpHeaders& headers = {},
        const std::string& body = "") override;

private:
    RequestTimings collect_timings(CURL* handle) const;

    HttpClientOptions options_;
    bool global_initialized_;
};

} // namespace nonkyc
