#pragma once

#include "browser_process.hpp"
#include "cdp_connection.hpp"
#include "page.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace page_pilot {

// A running browser that hands out pages.
class Browser {
public:
    virtual ~Browser() = default;

    virtual std::shared_ptr<Page> newPage() = 0;
    virtual bool isConnected() const = 0;
    // Invoked once when the browser goes away (crash, close, lost socket).
    virtual void onDisconnected(std::function<void()> callback) = 0;
    virtual void close() = 0;
};

class BrowserLauncher {
public:
    virtual ~BrowserLauncher() = default;
    // Throws LaunchError.
    virtual std::shared_ptr<Browser> launch(const LaunchOptions& options) = 0;
};

// Chromium driven over its DevTools WebSocket.
class ChromeBrowser : public Browser {
public:
    ChromeBrowser(ChildProcess process, std::shared_ptr<CdpConnection> conn);
    ~ChromeBrowser() override;

    std::shared_ptr<Page> newPage() override;
    bool isConnected() const override;
    void onDisconnected(std::function<void()> callback) override;
    void close() override;

private:
    ChildProcess process_;
    std::shared_ptr<CdpConnection> conn_;
    std::mutex callback_mutex_;
    std::function<void()> on_disconnected_;
};

class ChromeLauncher : public BrowserLauncher {
public:
    std::shared_ptr<Browser> launch(const LaunchOptions& options) override;
};

// Polls http://127.0.0.1:<port>/json/version until the browser publishes its
// WebSocket endpoint. Throws LaunchError on timeout.
std::string discover_debugger_url(unsigned port, Millis timeout);

} // namespace page_pilot
