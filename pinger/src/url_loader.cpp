#include "url_loader.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

std::vector<std::string> load_urls(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("failed to open " + path + ": " + std::strerror(errno));
    }

    auto urls = parse_urls(file);
    if (file.bad()) {
        throw std::runtime_error("failed to read " + path);
    }

    spdlog::debug("Loaded {} urls from {}", urls.size(), path);
    return urls;
}

std::vector<std::string> parse_urls(std::istream& input) {
    std::vector<std::string> urls;
    std::string line;

    while (std::getline(input, line)) {
        line = util::trim(line);
        if (line.empty() || util::starts_with(line, "#")) {
            continue;
        }
        urls.push_back(normalize_url(line));
    }

    return urls;
}

std::string normalize_url(const std::string& line) {
    if (!util::starts_with(line, "http://") && !util::starts_with(line, "https://")) {
        return "https://" + line;
    }
    return line;
}
