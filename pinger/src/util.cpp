
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace util {

void setup_logging(const std::string& service_name, const std::string& level) {
    // Results go to stdout; keep the log on stderr so the two never interleave
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);
    spdlog::set_default_logger(logger);

    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

int parse_int(const std::string& str, const std::string& what) {
    std::string value = trim(str);
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid value \"" + str + "\" for " + what + ": not an integer");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("invalid value \"" + str + "\" for " + what + ": not an integer");
    }
    return result;
}

bool parse_bool(const std::string& str, const std::string& what) {
    std::string value = trim(str);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw std::invalid_argument("invalid value \"" + str + "\" for " + what + ": not a boolean");
}

std::chrono::nanoseconds parse_duration(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) {
        throw std::invalid_argument("invalid duration \"\"");
    }

    bool negative = false;
    size_t pos = 0;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        pos = 1;
    }
    if (s.substr(pos) == "0") {
        return std::chrono::nanoseconds(0);
    }
    if (pos == s.size()) {
        throw std::invalid_argument("invalid duration \"" + str + "\"");
    }

    // Longest units first so "ms" is not read as "m"
    static const std::pair<const char*, double> units[] = {
        {"ns", 1.0},
        {"us", 1e3},
        {"\xC2\xB5s", 1e3},   // µs
        {"ms", 1e6},
        {"s", 1e9},
        {"m", 60e9},
        {"h", 3600e9},
    };

    double total_ns = 0.0;
    while (pos < s.size()) {
        size_t number_start = pos;
        while (pos < s.size() && (std::isdigit(static_cast<unsigned char>(s[pos])) || s[pos] == '.')) {
            ++pos;
        }
        if (pos == number_start) {
            throw std::invalid_argument("invalid duration \"" + str + "\"");
        }

        std::string digits = s.substr(number_start, pos - number_start);
        double number = 0.0;
        size_t consumed = 0;
        try {
            number = std::stod(digits, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid duration \"" + str + "\"");
        }
        if (consumed != digits.size()) {
            throw std::invalid_argument("invalid duration \"" + str + "\"");
        }

        double scale = 0.0;
        for (const auto& [suffix, ns] : units) {
            if (s.compare(pos, std::char_traits<char>::length(suffix), suffix) == 0) {
                scale = ns;
                pos += std::char_traits<char>::length(suffix);
                break;
            }
        }
        if (scale == 0.0) {
            throw std::invalid_argument("missing or unknown unit in duration \"" + str + "\"");
        }

        total_ns += number * scale;
    }

    // Largest duration representable in int64 nanoseconds (about 292 years)
    if (!std::isfinite(total_ns) ||
        total_ns >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        throw std::invalid_argument("duration \"" + str + "\" out of range");
    }

    auto result = std::chrono::nanoseconds(static_cast<int64_t>(std::llround(total_ns)));
    return negative ? -result : result;
}

namespace {

std::string trim_fraction(std::string number) {
    if (number.find('.') == std::string::npos) {
        return number;
    }
    while (!number.empty() && number.back() == '0') {
        number.pop_back();
    }
    if (!number.empty() && number.back() == '.') {
        number.pop_back();
    }
    return number;
}

} // namespace

std::string format_duration(std::chrono::nanoseconds duration) {
    int64_t ns = duration.count();
    if (ns == 0) {
        return "0s";
    }

    std::string sign = ns < 0 ? "-" : "";
    double abs_ns = std::fabs(static_cast<double>(ns));

    if (abs_ns < 1e3) {
        return sign + fmt::format("{}ns", static_cast<int64_t>(abs_ns));
    }
    if (abs_ns < 1e6) {
        return sign + trim_fraction(fmt::format("{:.3f}", abs_ns / 1e3)) + "\xC2\xB5s";
    }
    if (abs_ns < 1e9) {
        return sign + trim_fraction(fmt::format("{:.3f}", abs_ns / 1e6)) + "ms";
    }
    if (abs_ns < 60e9) {
        return sign + trim_fraction(fmt::format("{:.3f}", abs_ns / 1e9)) + "s";
    }

    auto minutes = static_cast<int64_t>(abs_ns / 60e9);
    double seconds = (abs_ns - static_cast<double>(minutes) * 60e9) / 1e9;
    return sign + fmt::format("{}m", minutes) + trim_fraction(fmt::format("{:.3f}", seconds)) + "s";
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';

    return ss.str();
}

std::string format_clock_time(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%H:%M:%S");
    return ss.str();
}

double random_fraction() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<double> dis(0.0, 1.0);
    return dis(gen);
}

} // namespace util
