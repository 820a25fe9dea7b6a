
#pragma once
#include <istream>
#include <string>
#include <vector>

// One URL per line. Blank lines and '#' comments are skipped and a missing
// scheme defaults to https://.
std::vector<std::string> load_urls(const std::string& path);
std::vector<std::string> parse_urls(std::istream& input);

std::string normalize_url(const std::string& line);
