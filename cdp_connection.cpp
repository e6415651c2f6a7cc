#include "cdp_connection.hpp"
#include "errors.hpp"
#include "url.hpp"

#include <iostream>

namespace page_pilot {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

CdpConnection::CdpConnection() = default;

CdpConnection::~CdpConnection() {
    setDisconnectHandler(nullptr);
    disconnect();
}

void CdpConnection::setDisconnectHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lk(disconnect_mutex_);
    on_disconnected_ = std::move(handler);
}

bool CdpConnection::connect(const std::string& websocket_url) {
    ParsedUrl url = parse_url(websocket_url);
    try {
        boost::system::error_code ec;
        auto results = resolver.resolve(url.host, std::to_string(url.port), ec);
        if (ec) {
            std::cerr << "[CDP] DNS resolution failed for " << url.host << ":" << url.port << " - " << ec.message() << std::endl;
            return false;
        }

        ws_ = std::make_unique<websocket::stream<beast::tcp_stream>>(ioc);
        ws_->next_layer().connect(results);

        // Screenshots arrive as base64 inside a single frame.
        ws_->read_message_max(256 * 1024 * 1024);
        ws_->set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "page-pilot/1.0");
            }));

        ws_->handshake(url.host + ":" + std::to_string(url.port), url.target);
        std::cout << "[CDP] Connected to " << websocket_url << std::endl;

        shouldStop = false;
        closed_notified_ = false;
        connected_ = true;
        ioThread = std::thread(&CdpConnection::runEventLoop, this);
        return true;

    } catch (std::exception const& e) {
        std::cerr << "[CDP] WebSocket connection error: " << e.what() << std::endl;
        ws_.reset();
        return false;
    }
}

void CdpConnection::disconnect() {
    shouldStop = true;

    // The reader thread owns reads on the stream; shutting the socket down
    // unblocks it without a second reader racing it for the close frame.
    if (ws_ && ws_->is_open()) {
        beast::error_code ec;
        beast::get_lowest_layer(*ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != net::error::not_connected) {
            std::cerr << "[CDP] shutdown: " << ec.message() << std::endl;
        }
    }

    if (ioThread.joinable()) {
        if (ioThread.get_id() == std::this_thread::get_id()) {
            ioThread.detach();
        } else {
            ioThread.join();
            if (ws_) {
                beast::error_code ec;
                beast::get_lowest_layer(*ws_).socket().close(ec);
            }
        }
    }
    markClosed("connection closed by client");
}

bool CdpConnection::isConnected() const {
    return connected_ && ws_ && ws_->is_open();
}

json CdpConnection::send(const std::string& method, const json& params,
                         const std::string& session_id, std::chrono::milliseconds timeout) {
    if (!connected_) {
        throw SessionClosedError("browser connection is closed (" + method + ")");
    }

    const int id = next_id_++;
    json command;
    command["id"] = id;
    command["method"] = method;
    if (!params.is_null() && !params.empty()) command["params"] = params;
    if (!session_id.empty()) command["sessionId"] = session_id;

    std::future<json> reply;
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        reply = pending_[id].get_future();
    }

    try {
        std::lock_guard<std::mutex> lk(write_mutex_);
        ws_->text(true);
        ws_->write(net::buffer(command.dump()));
    } catch (std::exception const& e) {
        {
            std::lock_guard<std::mutex> lk(pending_mutex_);
            pending_.erase(id);
        }
        throw SessionClosedError("write failed for " + method + ": " + e.what());
    }

    if (reply.wait_for(timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        pending_.erase(id);
        throw TimeoutError("no reply to " + method + " within " + std::to_string(timeout.count()) + " ms");
    }

    json response = reply.get();
    if (response.contains("error")) {
        const auto& err = response["error"];
        std::string message = err.is_object() ? err.value("message", err.dump()) : err.dump();
        if (message.find("No target with given id") != std::string::npos ||
            message.find("Session with given id not found") != std::string::npos) {
            throw SessionClosedError(method + ": " + message);
        }
        throw ProtocolError(method + ": " + message);
    }
    return response.value("result", json::object());
}

void CdpConnection::subscribe(const std::string& session_id, EventHandler handler) {
    std::lock_guard<std::mutex> lk(handlers_mutex_);
    handlers_[session_id] = std::move(handler);
}

void CdpConnection::unsubscribe(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(handlers_mutex_);
    handlers_.erase(session_id);
}

void CdpConnection::runEventLoop() {
    beast::flat_buffer buffer;
    std::string reason = "connection lost";

    while (!shouldStop && isConnected()) {
        try {
            ws_->read(buffer);
            std::string messageStr = beast::buffers_to_string(buffer.data());
            buffer.clear();
            handleMessage(messageStr);

        } catch (beast::system_error const& se) {
            if (se.code() != websocket::error::closed && !shouldStop) {
                std::cerr << "[CDP] WebSocket read error: " << se.code().message() << std::endl;
            }
            reason = se.code().message();
            break;
        } catch (std::exception const& e) {
            std::cerr << "[CDP] WebSocket event loop error: " << e.what() << std::endl;
            reason = e.what();
            break;
        }
    }

    std::cout << "[CDP] WebSocket event loop ended" << std::endl;
    markClosed(reason);
}

void CdpConnection::handleMessage(const std::string& message) {
    json msg = json::parse(message, nullptr, false);
    if (msg.is_discarded()) {
        std::cerr << "[CDP] Unparseable message (" << message.size() << " bytes)" << std::endl;
        return;
    }

    if (msg.contains("id")) {
        const int id = msg["id"].get<int>();
        std::promise<json> waiter;
        {
            std::lock_guard<std::mutex> lk(pending_mutex_);
            auto it = pending_.find(id);
            if (it == pending_.end()) return;  // caller already gave up
            waiter = std::move(it->second);
            pending_.erase(it);
        }
        waiter.set_value(std::move(msg));
        return;
    }

    const std::string method = msg.value("method", "");
    const json params = msg.value("params", json::object());
    std::string route = msg.value("sessionId", "");
    // Detach notifications arrive on the parent session but concern the child.
    if (method == "Target.detachedFromTarget" && params.contains("sessionId")) {
        route = params["sessionId"].get<std::string>();
    }

    EventHandler handler;
    {
        std::lock_guard<std::mutex> lk(handlers_mutex_);
        auto it = handlers_.find(route);
        if (it != handlers_.end()) handler = it->second;
    }
    if (handler) handler(method, params);
}

void CdpConnection::markClosed(const std::string& reason) {
    connected_ = false;
    if (closed_notified_.exchange(true)) return;

    std::map<int, std::promise<json>> orphaned;
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        orphaned.swap(pending_);
    }
    for (auto& kv : orphaned) {
        kv.second.set_exception(std::make_exception_ptr(SessionClosedError("browser disconnected: " + reason)));
    }

    std::map<std::string, EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lk(handlers_mutex_);
        handlers = handlers_;
    }
    for (auto& kv : handlers) {
        if (kv.second) kv.second("Inspector.detached", json{{"reason", reason}});
    }

    std::function<void()> notify;
    {
        std::lock_guard<std::mutex> lk(disconnect_mutex_);
        notify = on_disconnected_;
    }
    if (notify) notify();
}

} // namespace page_pilot
