#pragma once

#include <cstdint>
#include <string>

namespace page_pilot {

// Split form of ws://, wss://, http:// and https:// URLs.
struct ParsedUrl {
    std::string protocol;  // "ws", "wss", "http", "https"
    std::string host;
    uint16_t port = 0;
    std::string target;    // path + query, always starts with '/'
    bool use_ssl = false;
};

ParsedUrl parse_url(const std::string& url);

// Joins URL segments with exactly one '/' between them.
std::string join_url(const std::string& base, const std::string& path);

} // namespace page_pilot
