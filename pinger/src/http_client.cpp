#include "http_client.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <cstdint>

const char* to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Head: return "HEAD";
        case HttpMethod::Get: return "GET";
    }
    return "?";
}

class HttpClient::Impl {
public:
    explicit Impl(std::string user_agent)
        : user_agent_(std::move(user_agent)) {}

    HttpReply send(HttpMethod method,
                   const std::string& url,
                   std::chrono::milliseconds timeout,
                   const CancelToken& cancel) {
        HttpReply reply;

        cpr::Session session;
        session.SetUrl(cpr::Url{url});
        session.SetTimeout(cpr::Timeout{timeout});
        session.SetHeader(cpr::Header{{"User-Agent", user_agent_}});
        session.SetConnectionPool(pool_);

        // Returning false from the progress callback makes curl abort the transfer
        session.SetProgressCallback(cpr::ProgressCallback{
            [&cancel](auto /*download_total*/, auto /*download_now*/,
                      auto /*upload_total*/, auto /*upload_now*/, intptr_t /*userdata*/) -> bool {
                return !cancel.is_cancelled();
            }});

        cpr::Response response;
        if (method == HttpMethod::Head) {
            response = session.Head();
        } else {
            // Only the status matters; drop the body as it streams in
            session.SetWriteCallback(cpr::WriteCallback{
                [&cancel](auto&& /*data*/, intptr_t /*userdata*/) -> bool {
                    return !cancel.is_cancelled();
                }});
            response = session.Get();
        }

        if (response.error) {
            reply.aborted = cancel.is_cancelled();
            reply.error = response.error.message.empty()
                ? std::string("request failed")
                : response.error.message;
            spdlog::debug("{} {} failed: {}", to_string(method), url, *reply.error);
            return reply;
        }

        reply.status_code = static_cast<int>(response.status_code);
        return reply;
    }

private:
    std::string user_agent_;
    cpr::ConnectionPool pool_;
};

// --- PIMPL forward declarations ---
HttpClient::HttpClient(std::string user_agent) : pImpl_(std::make_unique<Impl>(std::move(user_agent))) {}
HttpClient::~HttpClient() = default;
HttpReply HttpClient::send(HttpMethod method, const std::string& url, std::chrono::milliseconds timeout, const CancelToken& cancel) {
    return pImpl_->send(method, url, timeout, cancel);
}
