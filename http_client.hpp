#pragma once

#include <chrono>
#include <map>
#include <string>

#include <boost/beast/http/verb.hpp>

namespace page_pilot {

struct HttpResponse {
    unsigned status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// One-shot HTTP/1.1 exchange over plain TCP or TLS (https://).
// Throws std::runtime_error on resolve/connect/handshake/IO failure or when
// `timeout` expires; HTTP error statuses are returned, not thrown.
HttpResponse http_request(boost::beast::http::verb verb,
                          const std::string& url,
                          const std::string& body = "",
                          const std::map<std::string, std::string>& headers = {},
                          std::chrono::milliseconds timeout = std::chrono::seconds(30));

} // namespace page_pilot
