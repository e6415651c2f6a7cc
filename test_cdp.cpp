// DevTools link and ChromeBrowser page setup against a local WebSocket peer.
#include "cdp_connection.hpp"
#include "chrome_browser.hpp"
#include "errors.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace page_pilot;
using json = nlohmann::json;

namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Accepts one DevTools client and answers each command with `reply(command)`,
// which returns {"result": ...} or {"error": ...}.
class FakeDevTools {
public:
    using Reply = std::function<json(const json& command)>;

    explicit FakeDevTools(Reply reply)
        : reply_(std::move(reply)),
          acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this] { serve(); });
    }

    // A client that connected must have gone away before this runs.
    ~FakeDevTools() {
        if (!accepted_) {
            // Nobody came; unblock accept() with a connection that says nothing.
            boost::system::error_code ec;
            tcp::socket nudge(ioc_);
            nudge.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
        }
        if (thread_.joinable()) thread_.join();
    }

    std::string url() const {
        return "ws://127.0.0.1:" + std::to_string(port_) + "/devtools/browser/fake";
    }

    std::vector<json> commands() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return commands_;
    }

    std::vector<std::string> methods() const {
        std::vector<std::string> out;
        for (const auto& c : commands()) out.push_back(c.value("method", ""));
        return out;
    }

private:
    void serve() {
        try {
            tcp::socket socket(ioc_);
            acceptor_.accept(socket);
            accepted_ = true;
            websocket::stream<tcp::socket> ws(std::move(socket));
            ws.accept();
            for (;;) {
                beast::flat_buffer buffer;
                ws.read(buffer);
                json command = json::parse(beast::buffers_to_string(buffer.data()));
                {
                    std::lock_guard<std::mutex> lk(mutex_);
                    commands_.push_back(command);
                }
                json answer = reply_(command);
                answer["id"] = command["id"];
                if (command.contains("sessionId")) answer["sessionId"] = command["sessionId"];
                ws.text(true);
                ws.write(net::buffer(answer.dump()));
            }
        } catch (const beast::system_error& e) {
            // The client hanging up is how every exchange ends.
            std::cout << "[FakeDevTools] client gone: " << e.code().message() << std::endl;
        }
    }

    Reply reply_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::atomic<bool> accepted_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<json> commands_;
};

json ok(json result = json::object()) {
    return json{{"result", std::move(result)}};
}

json failure(const std::string& message) {
    return json{{"error", {{"code", -32000}, {"message", message}}}};
}

bool contains(const std::vector<std::string>& methods, const std::string& m) {
    return std::find(methods.begin(), methods.end(), m) != methods.end();
}

} // namespace

TEST(CdpConnection, DisconnectHandlerRunsOnce) {
    FakeDevTools devtools([](const json&) { return ok(); });
    auto conn = std::make_shared<CdpConnection>();
    std::atomic<int> fired{0};
    conn->setDisconnectHandler([&] { ++fired; });
    ASSERT_TRUE(conn->connect(devtools.url()));

    EXPECT_TRUE(conn->send("Browser.getVersion").is_object());
    conn->disconnect();
    conn->disconnect();
    EXPECT_EQ(fired.load(), 1);
    EXPECT_FALSE(conn->isConnected());
    EXPECT_THROW(conn->send("Browser.getVersion"), SessionClosedError);
}

TEST(CdpConnection, ClearedHandlerIsNotCalled) {
    FakeDevTools devtools([](const json&) { return ok(); });
    auto conn = std::make_shared<CdpConnection>();
    std::atomic<int> fired{0};
    ASSERT_TRUE(conn->connect(devtools.url()));
    conn->setDisconnectHandler([&] { ++fired; });
    conn->setDisconnectHandler(nullptr);
    conn->disconnect();
    EXPECT_EQ(fired.load(), 0);
}

TEST(CdpConnection, ErrorRepliesBecomeProtocolErrors) {
    FakeDevTools devtools([](const json&) { return failure("no such method"); });
    auto conn = std::make_shared<CdpConnection>();
    ASSERT_TRUE(conn->connect(devtools.url()));
    EXPECT_THROW(conn->send("Page.teleport"), ProtocolError);
    conn->disconnect();
}

TEST(ChromeBrowser, NewPageAttachesAndEnablesDomains) {
    FakeDevTools devtools([](const json& command) {
        const std::string method = command.value("method", "");
        if (method == "Target.createTarget") return ok({{"targetId", "T1"}});
        if (method == "Target.attachToTarget") return ok({{"sessionId", "S1"}});
        return ok();
    });
    {
        auto conn = std::make_shared<CdpConnection>();
        ASSERT_TRUE(conn->connect(devtools.url()));
        ChromeBrowser browser(ChildProcess(), conn);

        auto page = browser.newPage();
        ASSERT_NE(page, nullptr);
        page->close();
        EXPECT_TRUE(page->isClosed());
    }

    const auto methods = devtools.methods();
    EXPECT_TRUE(contains(methods, "Page.enable"));
    EXPECT_TRUE(contains(methods, "Network.enable"));
    EXPECT_TRUE(contains(methods, "Target.closeTarget"));
    for (const auto& c : devtools.commands()) {
        if (c.value("method", "") == "Page.enable") EXPECT_EQ(c.value("sessionId", ""), "S1");
    }
}

TEST(ChromeBrowser, FailedAttachClosesTheNewTarget) {
    FakeDevTools devtools([](const json& command) {
        const std::string method = command.value("method", "");
        if (method == "Target.createTarget") return ok({{"targetId", "T9"}});
        if (method == "Target.attachToTarget") return failure("attach refused");
        return ok();
    });
    {
        auto conn = std::make_shared<CdpConnection>();
        ASSERT_TRUE(conn->connect(devtools.url()));
        ChromeBrowser browser(ChildProcess(), conn);
        EXPECT_THROW(browser.newPage(), ProtocolError);
        EXPECT_TRUE(browser.isConnected());
    }

    bool closed_t9 = false;
    for (const auto& c : devtools.commands()) {
        if (c.value("method", "") == "Target.closeTarget") {
            closed_t9 = c["params"].value("targetId", "") == "T9";
        }
    }
    EXPECT_TRUE(closed_t9);
}

TEST(ChromeBrowser, FailedDomainSetupClosesTheNewTarget) {
    FakeDevTools devtools([](const json& command) {
        const std::string method = command.value("method", "");
        if (method == "Target.createTarget") return ok({{"targetId", "T2"}});
        if (method == "Target.attachToTarget") return ok({{"sessionId", "S2"}});
        if (method == "Network.enable") return failure("network domain unavailable");
        return ok();
    });
    {
        auto conn = std::make_shared<CdpConnection>();
        ASSERT_TRUE(conn->connect(devtools.url()));
        ChromeBrowser browser(ChildProcess(), conn);
        EXPECT_THROW(browser.newPage(), ProtocolError);
    }

    const auto methods = devtools.methods();
    ASSERT_TRUE(contains(methods, "Target.closeTarget"));
    // Browser.close from the destructor comes after the cleanup.
    auto close_target = std::find(methods.begin(), methods.end(), "Target.closeTarget");
    auto browser_close = std::find(methods.begin(), methods.end(), "Browser.close");
    EXPECT_LT(close_target, browser_close);
}
