#include "url.hpp"

#include <stdexcept>

namespace page_pilot {

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result;
    result.protocol = "ws";
    result.host = "127.0.0.1";
    result.target = "/";

    std::string u = url;
    auto pos_protocol = u.find("://");
    if (pos_protocol != std::string::npos) {
        result.protocol = u.substr(0, pos_protocol);
        u = u.substr(pos_protocol + 3);
    }
    result.use_ssl = (result.protocol == "wss" || result.protocol == "https");
    result.port = result.use_ssl ? 443 : 80;

    auto slash = u.find('/');
    std::string authority = (slash == std::string::npos) ? u : u.substr(0, slash);
    if (slash != std::string::npos) result.target = u.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        try {
            result.port = static_cast<uint16_t>(std::stoi(authority.substr(colon + 1)));
        } catch (const std::logic_error&) {
            // not a number: keep the scheme default
        }
    } else if (!authority.empty()) {
        result.host = authority;
    }
    return result;
}

std::string join_url(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    bool base_slash = base.back() == '/';
    bool path_slash = path.front() == '/';
    if (base_slash && path_slash) return base + path.substr(1);
    if (!base_slash && !path_slash) return base + "/" + path;
    return base + path;
}

} // namespace page_pilot
