#include "session_manager.hpp"
#include "errors.hpp"

#include <iostream>

namespace page_pilot {

SessionManager::SessionManager(std::shared_ptr<BrowserLauncher> launcher, LaunchOptions options)
    : launcher_(std::move(launcher)), options_(std::move(options)) {}

SessionManager::~SessionManager() {
    shutdown();
}

void SessionManager::setObserver(Observer observer) {
    std::lock_guard<std::mutex> lk(observer_mutex_);
    observer_ = std::move(observer);
}

void SessionManager::notify(SessionEvent event) {
    Observer observer;
    {
        std::lock_guard<std::mutex> lk(observer_mutex_);
        observer = observer_;
    }
    if (observer) observer(event);
}

std::shared_ptr<Page> SessionManager::acquire() {
    std::unique_lock<std::mutex> lk(mutex_);
    retired_.clear();

    if (browser_ && !browser_->isConnected()) {
        std::cout << "[Session] Cached browser is no longer connected; relaunching" << std::endl;
        browser_.reset();
    }

    bool launched = false;
    if (!browser_) {
        std::shared_ptr<Browser> browser = launcher_->launch(options_);
        const std::uint64_t generation = ++generation_;
        browser->onDisconnected([this, generation]() {
            {
                std::lock_guard<std::mutex> guard(mutex_);
                if (generation_ != generation || !browser_) return;
                retired_.push_back(std::move(browser_));
                browser_.reset();
            }
            std::cerr << "[Session] Browser generation " << generation << " lost; next acquire relaunches" << std::endl;
            notify(SessionEvent::Disconnected);
        });
        browser_ = std::move(browser);
        launched = true;
        std::cout << "[Session] Browser generation " << generation << " ready" << std::endl;
    }

    std::shared_ptr<Browser> browser = browser_;
    lk.unlock();
    if (launched) notify(SessionEvent::Launched);

    return browser->newPage();
}

void SessionManager::release(const std::shared_ptr<Page>& page) {
    if (!page || page->isClosed()) return;
    try {
        page->close();
    } catch (const BrowserError& e) {
        std::cerr << "[Session] Page close failed: " << e.what() << std::endl;
    }
}

void SessionManager::shutdown() {
    std::shared_ptr<Browser> browser;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        retired_.clear();
        if (!browser_) return;
        browser = std::move(browser_);
        browser_.reset();
        ++generation_;
    }
    std::cout << "[Session] Shutting down browser" << std::endl;
    browser->close();
    notify(SessionEvent::Shutdown);
}

bool SessionManager::hasBrowser() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return browser_ != nullptr;
}

std::uint64_t SessionManager::generation() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return generation_;
}

} // namespace page_pilot
