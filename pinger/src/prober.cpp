#include "prober.hpp"
#include <spdlog/spdlog.h>

Prober::Prober(HttpTransport& transport, std::chrono::milliseconds timeout)
    : transport_(transport), timeout_(timeout) {
}

ProbeResult Prober::probe_once(const std::string& url, const CancelToken& cancel) const {
    ProbeResult result;
    result.url = url;
    result.timestamp = std::chrono::system_clock::now();
    auto start = std::chrono::steady_clock::now();

    HttpReply reply = transport_.send(HttpMethod::Head, url, timeout_, cancel);

    if (reply.error && !reply.aborted) {
        auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        auto remaining = timeout_ - spent;

        if (remaining.count() > 0) {
            spdlog::debug("HEAD {} failed ({}), retrying with GET", url, *reply.error);
            reply = transport_.send(HttpMethod::Get, url, remaining, cancel);
        }
    }

    result.duration = std::chrono::steady_clock::now() - start;
    result.status_code = reply.status_code;
    if (reply.error) {
        if (reply.aborted) {
            result.error = cancel.reason();
            result.error_kind = ProbeErrorKind::Cancelled;
        } else {
            result.error = reply.error;
            result.error_kind = ProbeErrorKind::Transport;
        }
        result.status_code = 0;
    }
    return result;
}
