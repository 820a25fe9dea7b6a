
#include "config.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

std::chrono::milliseconds to_millis(const std::string& value, const std::string& what) {
    try {
        return std::chrono::duration_cast<std::chrono::milliseconds>(util::parse_duration(value));
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(what + ": " + e.what());
    }
}

bool is_bool_flag(const std::string& name) {
    return name == "json" || name == "h" || name == "help";
}

void apply_flag(Config& config, const std::string& name, const std::string& value) {
    if (name == "urls") {
        config.urls_file = value;
    } else if (name == "concurrency") {
        config.concurrency = util::parse_int(value, "-concurrency");
    } else if (name == "rate") {
        config.rate = util::parse_int(value, "-rate");
    } else if (name == "timeout") {
        config.timeout = to_millis(value, "-timeout");
    } else if (name == "count") {
        config.count = util::parse_int(value, "-count");
    } else if (name == "interval") {
        config.interval = to_millis(value, "-interval");
    } else if (name == "retries") {
        config.retries = util::parse_int(value, "-retries");
    } else if (name == "user-agent") {
        config.user_agent = value;
    } else if (name == "log-level") {
        config.log_level = value;
    } else if (name == "json") {
        config.json_output = util::parse_bool(value, "-json");
    } else if (name == "h" || name == "help") {
        config.show_help = util::parse_bool(value, "-help");
    } else {
        throw std::invalid_argument("flag provided but not defined: -" + name);
    }
}

} // namespace

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = util::get_env_var("SERVICE_NAME", "pinger");
    config.log_level = util::get_env_var("LOG_LEVEL", "info");

    // Targets
    config.urls_file = util::get_env_var("PINGER_URLS", "urls.txt");

    // Probing
    config.concurrency = util::parse_int(util::get_env_var("PINGER_CONCURRENCY", "50"), "PINGER_CONCURRENCY");
    config.rate = util::parse_int(util::get_env_var("PINGER_RATE", "0"), "PINGER_RATE");
    config.timeout = to_millis(util::get_env_var("PINGER_TIMEOUT", "5s"), "PINGER_TIMEOUT");
    config.count = util::parse_int(util::get_env_var("PINGER_COUNT", "1"), "PINGER_COUNT");
    config.interval = to_millis(util::get_env_var("PINGER_INTERVAL", "2s"), "PINGER_INTERVAL");
    config.retries = util::parse_int(util::get_env_var("PINGER_RETRIES", "2"), "PINGER_RETRIES");
    config.user_agent = util::get_env_var("PINGER_USER_AGENT", "pinger/1.0");

    // Output
    config.json_output = util::parse_bool(util::get_env_var("PINGER_JSON", "false"), "PINGER_JSON");

    return config;
}

Config Config::from_args(int argc, const char* const* argv) {
    Config config = from_env();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            throw std::invalid_argument("unexpected argument: " + arg);
        }

        std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
        std::string value;
        bool has_value = false;

        auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            has_value = true;
        }

        if (name.empty()) {
            throw std::invalid_argument("bad flag syntax: " + arg);
        }

        if (!has_value) {
            if (is_bool_flag(name)) {
                value = "true";
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                throw std::invalid_argument("flag needs an argument: -" + name);
            }
        }

        apply_flag(config, name, value);
    }

    return config;
}

std::string Config::usage(const std::string& program) {
    return fmt::format(
        "Usage of {}:\n"
        "  -urls string         file with URLs, one per line; lines starting with # are ignored (default \"urls.txt\")\n"
        "  -concurrency int     max concurrent requests (default 50)\n"
        "  -rate int            rate limit in requests per second, 0 = unlimited (default 0)\n"
        "  -timeout duration    per-attempt HTTP timeout (default 5s)\n"
        "  -count int           how many rounds of pings per URL (default 1)\n"
        "  -interval duration   interval between rounds (default 2s)\n"
        "  -retries int         retries on failure per request (default 2)\n"
        "  -json                print results and summary as JSON lines\n"
        "  -user-agent string   User-Agent header (default \"pinger/1.0\")\n"
        "  -log-level string    debug, info, warn or error (default \"info\")\n",
        program);
}

void Config::validate() const {
    if (urls_file.empty()) {
        throw std::runtime_error("A URL file is required");
    }

    if (concurrency < 1) {
        throw std::runtime_error("Concurrency must be at least 1");
    }

    if (rate < 0) {
        throw std::runtime_error("Rate must not be negative");
    }

    if (timeout.count() <= 0) {
        throw std::runtime_error("Timeout must be positive");
    }

    if (count < 1) {
        throw std::runtime_error("Count must be at least 1");
    }

    if (interval.count() < 0) {
        throw std::runtime_error("Interval must not be negative");
    }

    if (retries < 0) {
        throw std::runtime_error("Retries must not be negative");
    }

    spdlog::debug("Configuration validated successfully");
}
