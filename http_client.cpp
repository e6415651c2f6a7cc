#include "http_client.hpp"
#include "url.hpp"

#include <stdexcept>

#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace page_pilot {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

// Runs the queued async operation to completion (tcp_stream enforces the deadline).
void await(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

void check(const beast::error_code& ec, const std::string& what, const std::string& url) {
    if (ec) throw std::runtime_error(what + " " + url + ": " + ec.message());
}

template <class Stream>
HttpResponse exchange(net::io_context& ioc, Stream& stream, beast::tcp_stream& lowest,
                      http::request<http::string_body>& req, std::chrono::milliseconds timeout,
                      const std::string& url) {
    beast::error_code ec;

    lowest.expires_after(timeout);
    http::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
    await(ioc);
    check(ec, "write", url);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    lowest.expires_after(timeout);
    http::async_read(stream, buffer, res, [&](beast::error_code e, std::size_t) { ec = e; });
    await(ioc);
    check(ec, "read", url);

    HttpResponse out;
    out.status = res.result_int();
    out.body = std::move(res.body());
    return out;
}

} // namespace

HttpResponse http_request(http::verb verb,
                          const std::string& url,
                          const std::string& body,
                          const std::map<std::string, std::string>& headers,
                          std::chrono::milliseconds timeout) {
    ParsedUrl u = parse_url(url);

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto results = resolver.resolve(u.host, std::to_string(u.port), ec);
    check(ec, "resolve", url);

    http::request<http::string_body> req{verb, u.target, 11};
    req.set(http::field::host, u.host);
    req.set(http::field::user_agent, "page-pilot/1.0");
    for (const auto& kv : headers) req.set(kv.first, kv.second);
    req.body() = body;
    req.prepare_payload();

    if (u.use_ssl) {
        ssl::context ctx{ssl::context::tls_client};
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);
        ssl::stream<beast::tcp_stream> stream(ioc, ctx);

        // Set SNI Hostname
        if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
            throw std::runtime_error("SNI setup failed for " + u.host);
        }

        auto& lowest = beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        lowest.async_connect(results, [&](beast::error_code e, tcp::endpoint) { ec = e; });
        await(ioc);
        check(ec, "connect", url);

        lowest.expires_after(timeout);
        stream.async_handshake(ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
        await(ioc);
        check(ec, "TLS handshake", url);

        HttpResponse out = exchange(ioc, stream, lowest, req, timeout, url);
        lowest.close();
        return out;
    }

    beast::tcp_stream stream(ioc);
    stream.expires_after(timeout);
    stream.async_connect(results, [&](beast::error_code e, tcp::endpoint) { ec = e; });
    await(ioc);
    check(ec, "connect", url);

    HttpResponse out = exchange(ioc, stream, stream, req, timeout, url);
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return out;
}

} // namespace page_pilot
