
#pragma once

#include "http_client.hpp"
#include "types.hpp"
#include <chrono>
#include <string>

class Prober {
public:
    Prober(HttpTransport& transport, std::chrono::milliseconds timeout);

    // One attempt: HEAD, falling back to GET when HEAD gets no HTTP response.
    // Both requests share the attempt's timeout budget.
    ProbeResult probe_once(const std::string& url, const CancelToken& cancel) const;

private:
    HttpTransport& transport_;
    std::chrono::milliseconds timeout_;
};
