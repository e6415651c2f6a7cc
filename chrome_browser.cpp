#include "chrome_browser.hpp"
#include "cdp_page.hpp"
#include "errors.hpp"
#include "http_client.hpp"

#include <iostream>
#include <thread>

#include <nlohmann/json.hpp>

namespace page_pilot {

using json = nlohmann::json;
namespace http = boost::beast::http;

std::string discover_debugger_url(unsigned port, Millis timeout) {
    const std::string url = "http://127.0.0.1:" + std::to_string(port) + "/json/version";
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string last_error = "no response";

    while (std::chrono::steady_clock::now() < deadline) {
        try {
            HttpResponse res = http_request(http::verb::get, url, "", {}, std::chrono::seconds(2));
            if (res.ok()) {
                json body = json::parse(res.body, nullptr, false);
                if (!body.is_discarded() && body.contains("webSocketDebuggerUrl")) {
                    return body["webSocketDebuggerUrl"].get<std::string>();
                }
                last_error = "no webSocketDebuggerUrl in /json/version";
            } else {
                last_error = "HTTP " + std::to_string(res.status);
            }
        } catch (const std::runtime_error& e) {
            // Browser not listening yet.
            last_error = e.what();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    throw LaunchError("DevTools endpoint on port " + std::to_string(port) +
                      " not available: " + last_error);
}

// --------------------------- ChromeLauncher ----------------------------------
std::shared_ptr<Browser> ChromeLauncher::launch(const LaunchOptions& options) {
    SpawnSpec spec;
    spec.argv = build_browser_argv(options);
    spec.env = options.env;

    std::cout << "[Session] Launching " << options.executable
              << " (profile " << options.profile_dir << ", port " << options.debug_port << ")" << std::endl;
    ChildProcess process = spawn_process(spec);

    std::string ws_url = discover_debugger_url(options.debug_port, Millis(options.launch_timeout_ms));
    if (!process.running()) {
        // Another browser already owns the port; we would be driving the wrong one.
        throw LaunchError("browser exited during startup (is port " +
                          std::to_string(options.debug_port) + " already in use?)");
    }

    auto conn = std::make_shared<CdpConnection>();
    if (!conn->connect(ws_url)) {
        throw LaunchError("could not connect to " + ws_url);
    }
    return std::make_shared<ChromeBrowser>(std::move(process), std::move(conn));
}

// --------------------------- ChromeBrowser -----------------------------------
ChromeBrowser::ChromeBrowser(ChildProcess process, std::shared_ptr<CdpConnection> conn)
    : process_(std::move(process)), conn_(std::move(conn)) {
    conn_->setDisconnectHandler([this]() {
        std::function<void()> cb;
        {
            std::lock_guard<std::mutex> lk(callback_mutex_);
            cb = on_disconnected_;
        }
        std::cerr << "[Session] Browser disconnected" << std::endl;
        if (cb) cb();
    });
}

ChromeBrowser::~ChromeBrowser() {
    close();
}

std::shared_ptr<Page> ChromeBrowser::newPage() {
    json created = conn_->send("Target.createTarget", {{"url", "about:blank"}});
    const std::string target_id = created.value("targetId", "");
    if (target_id.empty()) throw ProtocolError("Target.createTarget returned no targetId");

    try {
        json attached = conn_->send("Target.attachToTarget", {{"targetId", target_id}, {"flatten", true}});
        const std::string session_id = attached.value("sessionId", "");
        if (session_id.empty()) throw ProtocolError("Target.attachToTarget returned no sessionId");

        auto page = std::make_shared<CdpPage>(conn_, target_id, session_id);
        page->enableDomains();
        std::cout << "[Session] Opened page " << target_id << std::endl;
        return page;
    } catch (const BrowserError& e) {
        std::cerr << "[Session] Page " << target_id << " unusable, closing it: " << e.what() << std::endl;
        if (conn_->isConnected()) {
            try {
                conn_->send("Target.closeTarget", {{"targetId", target_id}});
            } catch (const BrowserError& close_error) {
                std::cerr << "[Session] closeTarget " << target_id << ": " << close_error.what() << std::endl;
            }
        }
        throw;
    }
}

bool ChromeBrowser::isConnected() const {
    return conn_->isConnected();
}

void ChromeBrowser::onDisconnected(std::function<void()> callback) {
    std::lock_guard<std::mutex> lk(callback_mutex_);
    on_disconnected_ = std::move(callback);
}

void ChromeBrowser::close() {
    {
        std::lock_guard<std::mutex> lk(callback_mutex_);
        on_disconnected_ = nullptr;
    }
    conn_->setDisconnectHandler(nullptr);
    if (conn_->isConnected()) {
        try {
            conn_->send("Browser.close", json::object(), "", std::chrono::seconds(5));
        } catch (const BrowserError& e) {
            std::cerr << "[Session] Browser.close: " << e.what() << std::endl;
        }
    }
    conn_->disconnect();
    process_.terminate();
}

} // namespace page_pilot
