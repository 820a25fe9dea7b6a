
#pragma once
#include <chrono>
#include <string>

class Config {
public:
    // Service info
    std::string service_name = "pinger";
    std::string log_level = "info";

    // Targets
    std::string urls_file = "urls.txt";

    // Probing
    int concurrency = 50;                                   // max in-flight tasks
    int rate = 0;                                           // tokens per second, 0 = unlimited
    std::chrono::milliseconds timeout{5000};                // per attempt
    int count = 1;                                          // rounds
    std::chrono::milliseconds interval{2000};               // between rounds
    int retries = 2;                                        // extra attempts after the first
    std::string user_agent = "pinger/1.0";

    // Output
    bool json_output = false;
    bool show_help = false;

    static Config from_env();

    // Environment first, then command-line flags on top
    static Config from_args(int argc, const char* const* argv);

    static std::string usage(const std::string& program);

    void validate() const;
};
