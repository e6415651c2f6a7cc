#include "control_channel.hpp"
#include "url.hpp"

#include <iostream>
#include <sstream>

namespace page_pilot {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

std::optional<json> dispatch_control_message(const std::string& message, InterruptCoordinator& coordinator) {
    json messageJson = json::parse(message, nullptr, false);
    if (messageJson.is_discarded() || !messageJson.is_object()) {
        std::cerr << "[Control] JSON parse error; raw message: " << message << std::endl;
        return std::nullopt;
    }
    const std::string eventType = messageJson.value("type", "");
    const json eventData = messageJson.value("data", json::object());
    std::string taskId;
    if (eventData.is_object() && eventData.contains("taskId")) {
        const json& id = eventData["taskId"];
        taskId = id.is_string() ? id.get<std::string>() : id.dump();
    }

    if (eventType == "task:resume") {
        ResumeResult r = coordinator.resume(taskId);
        std::cout << "[Control] Resume " << taskId << ": " << (r.accepted ? "accepted" : "refused (" + r.reason + ")") << std::endl;
        json data = {{"taskId", taskId}, {"accepted", r.accepted}};
        if (!r.accepted) data["reason"] = r.reason;
        return json{{"type", "task:resume:result"}, {"data", data}};
    }
    if (eventType == "task:cancel") {
        const bool cancelled = coordinator.cancel(taskId);
        std::cout << "[Control] Cancel " << taskId << ": " << (cancelled ? "done" : "task not paused") << std::endl;
        return json{{"type", "task:cancel:result"}, {"data", {{"taskId", taskId}, {"cancelled", cancelled}}}};
    }

    std::cout << "[Control] Unknown event type: " << eventType << std::endl;
    return std::nullopt;
}

std::string handle_console_command(const std::string& line, InterruptCoordinator& coordinator) {
    std::istringstream in(line);
    std::string verb, taskId;
    in >> verb >> taskId;

    if (verb.empty()) {
        // Bare Enter: the operator solved whatever was on screen.
        auto paused = coordinator.pausedTasks();
        if (paused.empty()) return "no paused tasks";
        std::string out;
        for (const auto& id : paused) {
            ResumeResult r = coordinator.resume(id);
            out += id + ": " + (r.accepted ? "resumed" : "still blocked (" + r.reason + ")") + "\n";
        }
        out.pop_back();
        return out;
    }
    if (verb == "status") {
        auto paused = coordinator.pausedTasks();
        if (paused.empty()) return "no paused tasks";
        std::string out = "paused:";
        for (const auto& id : paused) out += " " + id;
        return out;
    }
    if (taskId.empty()) return "usage: resume <taskId> | cancel <taskId> | status";
    if (verb == "resume") {
        ResumeResult r = coordinator.resume(taskId);
        return r.accepted ? taskId + ": resumed" : taskId + ": refused (" + r.reason + ")";
    }
    if (verb == "cancel") {
        return coordinator.cancel(taskId) ? taskId + ": cancelled" : taskId + ": not paused";
    }
    return "unknown command '" + verb + "'";
}

// --------------------------- ControlChannel ----------------------------------
ControlChannel::ControlChannel(InterruptCoordinator& coordinator) : coordinator_(coordinator) {
    // Operator endpoints commonly run with self-signed certificates
    ssl_ctx.set_verify_mode(ssl::verify_none);
    ssl_ctx.set_options(ssl::context::default_workarounds |
                        ssl::context::no_sslv2 |
                        ssl::context::no_sslv3 |
                        ssl::context::single_dh_use);
}

ControlChannel::~ControlChannel() {
    disconnect();
}

bool ControlChannel::connect(const std::string& url) {
    try {
        ParsedUrl u = parse_url(url);
        const std::string port = std::to_string(u.port);

        boost::system::error_code ec;
        auto results = resolver.resolve(u.host, port, ec);
        if (ec) {
            std::cerr << "[Control] DNS resolution failed for " << u.host << ":" << port << " - " << ec.message() << std::endl;
            return false;
        }

        use_ssl_connection = u.use_ssl;
        auto decorate = websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "page-pilot/1.0");
            });

        if (use_ssl_connection) {
            ssl_ws = std::make_unique<websocket::stream<ssl::stream<beast::tcp_stream>>>(ioc, ssl_ctx);
            beast::get_lowest_layer(*ssl_ws).connect(results);

            // Set SNI Hostname
            if (!SSL_set_tlsext_host_name(ssl_ws->next_layer().native_handle(), u.host.c_str())) {
                beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                throw beast::system_error{sni_ec};
            }
            ssl_ws->next_layer().handshake(ssl::stream_base::client);
            ssl_ws->set_option(std::move(decorate));
            ssl_ws->handshake(u.host + ':' + port, u.target);
        } else {
            plain_ws = std::make_unique<websocket::stream<beast::tcp_stream>>(ioc);
            plain_ws->next_layer().connect(results);
            plain_ws->set_option(std::move(decorate));
            plain_ws->handshake(u.host + ':' + port, u.target);
        }
        std::cout << "[Control] Connected to " << url << std::endl;

        shouldStop = false;
        ioThread = std::thread(&ControlChannel::runEventLoop, this);
        return true;

    } catch (std::exception const& e) {
        std::cerr << "[Control] WebSocket connection error: " << e.what() << std::endl;
        return false;
    }
}

void ControlChannel::disconnect() {
    shouldStop = true;

    try {
        std::lock_guard<std::mutex> lk(write_mutex_);
        if (use_ssl_connection && ssl_ws && ssl_ws->is_open()) {
            ssl_ws->close(websocket::close_code::normal);
        } else if (!use_ssl_connection && plain_ws && plain_ws->is_open()) {
            plain_ws->close(websocket::close_code::normal);
        }
    } catch (std::exception const& e) {
        std::cerr << "[Control] close: " << e.what() << std::endl;
        beast::error_code ec;
        if (ssl_ws) beast::get_lowest_layer(*ssl_ws).socket().close(ec);
        if (plain_ws) beast::get_lowest_layer(*plain_ws).socket().close(ec);
    }

    if (ioThread.joinable()) {
        ioThread.join();
    }
}

bool ControlChannel::isConnected() const {
    if (use_ssl_connection) {
        return ssl_ws && ssl_ws->is_open();
    }
    return plain_ws && plain_ws->is_open();
}

void ControlChannel::send(const json& payload) {
    const std::string text = payload.dump();
    std::lock_guard<std::mutex> lk(write_mutex_);
    if (use_ssl_connection && ssl_ws) {
        ssl_ws->text(true);
        ssl_ws->write(net::buffer(text));
    } else if (plain_ws) {
        plain_ws->text(true);
        plain_ws->write(net::buffer(text));
    }
}

void ControlChannel::publish(const ProgressEvent& event) {
    if (!isConnected()) {
        std::cerr << "[Control] Not connected; dropping progress for " << event.task_id << std::endl;
        return;
    }
    try {
        send({{"type", "task:progress"}, {"data", to_json(event)}});
    } catch (beast::system_error const& se) {
        std::cerr << "[Control] Progress write failed: " << se.code().message() << std::endl;
    }
}

void ControlChannel::runEventLoop() {
    beast::flat_buffer buffer;

    while (!shouldStop && isConnected()) {
        try {
            if (use_ssl_connection && ssl_ws) {
                ssl_ws->read(buffer);
            } else if (!use_ssl_connection && plain_ws) {
                plain_ws->read(buffer);
            } else {
                break;
            }

            std::string messageStr = beast::buffers_to_string(buffer.data());
            buffer.clear();
            handleMessage(messageStr);

        } catch (beast::system_error const& se) {
            if (se.code() != websocket::error::closed && !shouldStop) {
                std::cerr << "[Control] WebSocket read error: " << se.code().message() << std::endl;
            }
            break;
        } catch (std::exception const& e) {
            std::cerr << "[Control] WebSocket event loop error: " << e.what() << std::endl;
            break;
        }
    }

    std::cout << "[Control] WebSocket event loop ended" << std::endl;
}

void ControlChannel::handleMessage(const std::string& message) {
    std::optional<json> reply = dispatch_control_message(message, coordinator_);
    if (!reply) return;
    try {
        send(*reply);
    } catch (beast::system_error const& se) {
        std::cerr << "[Control] Reply write failed: " << se.code().message() << std::endl;
    }
}

} // namespace page_pilot
