
#pragma once
#include <string>
#include <chrono>

namespace util {

// Logging
void setup_logging(const std::string& service_name, const std::string& level);

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");

// String utilities
std::string trim(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);

// Parsing helpers; throw std::invalid_argument on malformed input
int parse_int(const std::string& str, const std::string& what);
bool parse_bool(const std::string& str, const std::string& what);

// Go-style durations: "300ms", "2s", "1m30s", "1.5h", "250us". A bare "0" is allowed.
std::chrono::nanoseconds parse_duration(const std::string& str);
std::string format_duration(std::chrono::nanoseconds duration);

// Time utilities
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
std::string format_clock_time(const std::chrono::system_clock::time_point& tp);

// Random utilities
double random_fraction();

} // namespace util
