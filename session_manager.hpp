#pragma once

#include "browser_process.hpp"
#include "chrome_browser.hpp"
#include "page.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace page_pilot {

enum class SessionEvent {
    Launched,
    Disconnected,
    Shutdown
};

// Owns the one shared browser and hands a fresh page to each task.
//
// The browser is launched lazily on the first acquire() and relaunched on the
// acquire() after it disconnects. Launching happens under the manager's lock,
// so two launches never overlap. Launch errors propagate to the caller.
class SessionManager {
public:
    using Observer = std::function<void(SessionEvent)>;

    SessionManager(std::shared_ptr<BrowserLauncher> launcher, LaunchOptions options);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    std::shared_ptr<Page> acquire();
    // Best-effort: closes the page, logging (not throwing) failures.
    void release(const std::shared_ptr<Page>& page);
    void shutdown();

    void setObserver(Observer observer);
    bool hasBrowser() const;
    std::uint64_t generation() const;

private:
    void notify(SessionEvent event);

    std::shared_ptr<BrowserLauncher> launcher_;
    LaunchOptions options_;

    mutable std::mutex mutex_;
    std::shared_ptr<Browser> browser_;
    // Disconnected browsers, destroyed from a caller thread rather than the one reporting the loss.
    std::vector<std::shared_ptr<Browser>> retired_;
    std::uint64_t generation_ = 0;

    std::mutex observer_mutex_;
    Observer observer_;
};

} // namespace page_pilot
