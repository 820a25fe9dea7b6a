
#pragma once

#include "cancel_token.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

enum class HttpMethod { Head, Get };

const char* to_string(HttpMethod method);

struct HttpReply {
    int status_code = 0;
    std::optional<std::string> error;   // set when no HTTP response arrived
    bool aborted = false;               // transfer stopped by cancellation
};

// Executes single HTTP requests. Implementations must be safe for concurrent
// use from many probe tasks.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpReply send(HttpMethod method,
                           const std::string& url,
                           std::chrono::milliseconds timeout,
                           const CancelToken& cancel) = 0;
};

// cpr-backed transport sharing one connection pool across all requests.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(std::string user_agent);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpReply send(HttpMethod method,
                   const std::string& url,
                   std::chrono::milliseconds timeout,
                   const CancelToken& cancel) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
