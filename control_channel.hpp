#pragma once

#include "interrupt_coordinator.hpp"
#include "progress.hpp"

#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace page_pilot {

// Applies one operator message ("task:resume" / "task:cancel") to the
// coordinator. Returns the reply to send back, if the message calls for one.
std::optional<nlohmann::json> dispatch_control_message(const std::string& message,
                                                       InterruptCoordinator& coordinator);

// Console form of the same commands: "resume <taskId>", "cancel <taskId>",
// "status", or an empty line to resume every paused task. Returns the text to print.
std::string handle_console_command(const std::string& line, InterruptCoordinator& coordinator);

// WebSocket link to the operator endpoint: pushes progress, takes resume/cancel.
class ControlChannel : public ProgressSink {
public:
    using json = nlohmann::json;

    explicit ControlChannel(InterruptCoordinator& coordinator);
    ~ControlChannel() override;

    // ws:// or wss:// URL.
    bool connect(const std::string& url);
    void disconnect();
    bool isConnected() const;

    // Dropped with a log line while disconnected.
    void publish(const ProgressEvent& event) override;

private:
    void runEventLoop();
    void handleMessage(const std::string& message);
    void send(const json& payload);

    InterruptCoordinator& coordinator_;

    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::asio::ssl::context ssl_ctx{boost::asio::ssl::context::tls_client};

    std::unique_ptr<boost::beast::websocket::stream<boost::asio::ssl::stream<boost::beast::tcp_stream>>> ssl_ws;
    std::unique_ptr<boost::beast::websocket::stream<boost::beast::tcp_stream>> plain_ws;
    bool use_ssl_connection = false;

    std::mutex write_mutex_;
    std::thread ioThread;
    std::atomic<bool> shouldStop{false};
};

} // namespace page_pilot
