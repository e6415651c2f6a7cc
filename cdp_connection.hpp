#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace page_pilot {

// WebSocket link to a browser's DevTools endpoint.
//
// One reader thread receives everything: replies are matched to the waiting
// send() by message id, events are routed to the subscriber registered for
// their sessionId ("" = browser-level events).
class CdpConnection {
public:
    using json = nlohmann::json;
    using EventHandler = std::function<void(const std::string& method, const json& params)>;

    CdpConnection();
    ~CdpConnection();

    bool connect(const std::string& websocket_url);
    void disconnect();
    bool isConnected() const;

    // Sends a command and blocks for its result object.
    // Throws SessionClosedError, TimeoutError or ProtocolError.
    json send(const std::string& method,
              const json& params = json::object(),
              const std::string& session_id = "",
              std::chrono::milliseconds timeout = std::chrono::seconds(30));

    void subscribe(const std::string& session_id, EventHandler handler);
    void unsubscribe(const std::string& session_id);

    // Called once, from the reader thread or disconnect(), when the link goes away.
    // Safe to replace while the reader thread runs; nullptr clears it.
    void setDisconnectHandler(std::function<void()> handler);

private:
    void runEventLoop();
    void handleMessage(const std::string& message);
    void markClosed(const std::string& reason);

    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    std::unique_ptr<boost::beast::websocket::stream<boost::beast::tcp_stream>> ws_;

    std::thread ioThread;
    std::atomic<bool> shouldStop{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_notified_{false};

    std::mutex write_mutex_;

    std::mutex pending_mutex_;
    std::map<int, std::promise<json>> pending_;
    std::atomic<int> next_id_{1};

    std::mutex handlers_mutex_;
    std::map<std::string, EventHandler> handlers_;

    std::mutex disconnect_mutex_;
    std::function<void()> on_disconnected_;
};

} // namespace page_pilot
