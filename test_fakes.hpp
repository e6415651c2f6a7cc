#pragma once

// In-process stand-ins for the browser, storage and progress seams.

#include "blob_store.hpp"
#include "chrome_browser.hpp"
#include "errors.hpp"
#include "image.hpp"
#include "page.hpp"
#include "progress.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace page_pilot {
namespace testing_support {

// Scrollable element of `total` CSS px shown through a `viewport` CSS px window.
struct ScrollModel {
    double total = 0;
    double viewport = 0;
    double top = 0;
    double dpr = 1.0;
    int width = 16;
};

class FakePage : public Page {
public:
    using json = nlohmann::json;

    // --------- scripted state ---------
    void show(const std::string& selector, bool visible = true) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (visible) visible_.insert(selector); else visible_.erase(selector);
    }
    void setText(const std::string& selector, const std::string& text) {
        std::lock_guard<std::mutex> lk(mutex_);
        texts_[selector] = text;
    }
    void setElementImage(const std::string& selector, const std::string& bytes) {
        std::lock_guard<std::mutex> lk(mutex_);
        element_images_[selector] = bytes;
    }
    void setSnapshots(const std::string& selector, std::vector<ElementSnapshot> snaps) {
        std::lock_guard<std::mutex> lk(mutex_);
        snapshots_[selector] = std::move(snaps);
    }
    void setScrollModel(const std::string& selector, ScrollModel model) {
        std::lock_guard<std::mutex> lk(mutex_);
        scroll_selector_ = selector;
        scroll_ = model;
    }
    void setEvaluator(std::function<json(const std::string&)> fn) {
        std::lock_guard<std::mutex> lk(mutex_);
        evaluator_ = std::move(fn);
    }
    // The first `frames` full-page captures differ from each other; later ones
    // repeat "full-page-bytes". A negative count never settles.
    void setChangingFullPageFrames(int frames) { changing_frames_ = frames; }
    void setNetworkIdle(bool idle) { network_idle_ = idle; }
    void failNavigation(bool fail) { fail_navigation_ = fail; }
    void markClosed() { closed_ = true; }

    // --------- observations ---------
    std::vector<std::string> navigations() const { std::lock_guard<std::mutex> lk(mutex_); return navigations_; }
    std::vector<std::string> clicks() const { std::lock_guard<std::mutex> lk(mutex_); return clicks_; }
    int elementCaptures() const { return element_captures_; }
    int scrollCalls() const { return scroll_calls_; }
    int wheelCalls() const { return wheel_calls_; }
    int closeCalls() const { return close_calls_; }

    // --------- Page ---------
    void navigate(const std::string& url, Millis) override {
        ensureOpen();
        if (fail_navigation_) throw TimeoutError("navigation to " + url + " timed out");
        std::lock_guard<std::mutex> lk(mutex_);
        navigations_.push_back(url);
    }

    void waitForVisible(const std::string& selector, Millis timeout) override {
        ensureOpen();
        std::lock_guard<std::mutex> lk(mutex_);
        if (!visible_.count(selector)) {
            throw TimeoutError("waiting for selector `" + selector + "` failed: " +
                               std::to_string(timeout.count()) + "ms exceeded");
        }
    }

    void click(const std::string& selector) override {
        ensureOpen();
        std::lock_guard<std::mutex> lk(mutex_);
        clicks_.push_back(selector);
    }

    void hover(const std::string&) override { ensureOpen(); }

    void mouseWheel(double) override {
        ensureOpen();
        ++wheel_calls_;
    }

    std::string textContent(const std::string& selector) override {
        ensureOpen();
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = texts_.find(selector);
        if (it == texts_.end()) throw ScriptError("no element matches `" + selector + "`");
        return it->second;
    }

    json evaluate(const std::string& expression) override {
        ensureOpen();
        std::function<json(const std::string&)> fn;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            fn = evaluator_;
        }
        return fn ? fn(expression) : json();
    }

    std::vector<ElementSnapshot> inspect(const std::string& selector) override {
        ensureOpen();
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = snapshots_.find(selector);
        return it == snapshots_.end() ? std::vector<ElementSnapshot>() : it->second;
    }

    ScrollMetrics scrollMetrics(const std::string& selector) override {
        ensureOpen();
        std::lock_guard<std::mutex> lk(mutex_);
        if (selector != scroll_selector_) throw ScriptError("no element matches `" + selector + "`");
        ScrollMetrics m;
        m.scroll_top = scroll_.top;
        m.scroll_height = scroll_.total;
        m.client_height = scroll_.viewport;
        return m;
    }

    void scrollBy(const std::string& selector, double delta_y) override {
        ensureOpen();
        std::lock_guard<std::mutex> lk(mutex_);
        if (selector != scroll_selector_) throw ScriptError("no element matches `" + selector + "`");
        ++scroll_calls_;
        const double bottom = std::max(0.0, scroll_.total - scroll_.viewport);
        scroll_.top = std::max(0.0, std::min(scroll_.top + delta_y, bottom));
    }

    double devicePixelRatio() override {
        std::lock_guard<std::mutex> lk(mutex_);
        return scroll_.dpr;
    }

    std::string captureElement(const std::string& selector) override {
        ensureOpen();
        std::lock_guard<std::mutex> lk(mutex_);
        ++element_captures_;
        if (selector == scroll_selector_ && !element_images_.count(selector)) {
            // One flat colour per scroll position, viewport-high in device pixels.
            const int rows = static_cast<int>(scroll_.viewport * scroll_.dpr + 0.5);
            const std::uint32_t rgb = 0x010101u * static_cast<std::uint32_t>(element_captures_ % 200 + 20);
            return PngImage::blank(scroll_.width, rows, rgb).encode();
        }
        auto it = element_images_.find(selector);
        if (it == element_images_.end()) throw ScriptError("no element matches `" + selector + "`");
        return it->second;
    }

    std::string captureViewport() override {
        ensureOpen();
        return "viewport-bytes";
    }

    std::string captureFullPage() override {
        ensureOpen();
        const int n = full_page_captures_++;
        const int changing = changing_frames_;
        if (changing < 0 || n < changing) return "full-page-frame-" + std::to_string(n);
        return "full-page-bytes";
    }

    bool waitForNetworkIdle(Millis, Millis) override {
        ensureOpen();
        return network_idle_;
    }

    bool isClosed() const override { return closed_; }

    void close() override {
        ++close_calls_;
        closed_ = true;
    }

private:
    void ensureOpen() const {
        if (closed_) throw SessionClosedError("page is closed");
    }

    mutable std::mutex mutex_;
    std::set<std::string> visible_;
    std::map<std::string, std::string> texts_;
    std::map<std::string, std::string> element_images_;
    std::map<std::string, std::vector<ElementSnapshot>> snapshots_;
    std::function<json(const std::string&)> evaluator_;
    std::string scroll_selector_;
    ScrollModel scroll_;
    std::vector<std::string> navigations_;
    std::vector<std::string> clicks_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> network_idle_{true};
    std::atomic<bool> fail_navigation_{false};
    std::atomic<int> element_captures_{0};
    std::atomic<int> scroll_calls_{0};
    std::atomic<int> wheel_calls_{0};
    std::atomic<int> close_calls_{0};
    std::atomic<int> full_page_captures_{0};
    std::atomic<int> changing_frames_{0};
};

class FakeBrowser : public Browser {
public:
    explicit FakeBrowser(std::function<std::shared_ptr<FakePage>()> page_factory)
        : page_factory_(std::move(page_factory)) {}

    std::shared_ptr<Page> newPage() override {
        if (!connected_) throw SessionClosedError("browser disconnected");
        auto page = page_factory_();
        std::lock_guard<std::mutex> lk(mutex_);
        pages_.push_back(page);
        return page;
    }
    bool isConnected() const override { return connected_; }
    void onDisconnected(std::function<void()> callback) override {
        std::lock_guard<std::mutex> lk(mutex_);
        on_disconnected_ = std::move(callback);
    }
    void close() override {
        ++close_calls_;
        connected_ = false;
    }

    // Simulates the browser going away underneath us.
    void crash() {
        connected_ = false;
        std::function<void()> cb;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            cb = on_disconnected_;
        }
        for (auto& p : pages_) p->markClosed();
        if (cb) cb();
    }

    int closeCalls() const { return close_calls_; }

private:
    std::function<std::shared_ptr<FakePage>()> page_factory_;
    std::mutex mutex_;
    std::vector<std::shared_ptr<FakePage>> pages_;
    std::function<void()> on_disconnected_;
    std::atomic<bool> connected_{true};
    std::atomic<int> close_calls_{0};
};

class FakeLauncher : public BrowserLauncher {
public:
    explicit FakeLauncher(std::function<std::shared_ptr<FakePage>()> page_factory = [] {
        return std::make_shared<FakePage>();
    }) : page_factory_(std::move(page_factory)) {}

    std::shared_ptr<Browser> launch(const LaunchOptions& options) override {
        ++launches_;
        last_profile_dir_ = options.profile_dir;
        if (launch_delay_.count() > 0) std::this_thread::sleep_for(launch_delay_);
        if (fail_) throw LaunchError("executable not found: " + options.executable);
        auto browser = std::make_shared<FakeBrowser>(page_factory_);
        std::lock_guard<std::mutex> lk(mutex_);
        browsers_.push_back(browser);
        return browser;
    }

    void setLaunchDelay(Millis delay) { launch_delay_ = delay; }
    void setFail(bool fail) { fail_ = fail; }
    int launches() const { return launches_; }
    std::string lastProfileDir() const { return last_profile_dir_; }
    std::shared_ptr<FakeBrowser> browser(std::size_t i) {
        std::lock_guard<std::mutex> lk(mutex_);
        return browsers_.at(i);
    }

private:
    std::function<std::shared_ptr<FakePage>()> page_factory_;
    std::mutex mutex_;
    std::vector<std::shared_ptr<FakeBrowser>> browsers_;
    Millis launch_delay_{0};
    std::atomic<bool> fail_{false};
    std::atomic<int> launches_{0};
    std::string last_profile_dir_;
};

class MemoryBlobStore : public BlobStore {
public:
    std::string upload(const std::string& bytes, const std::string& key) override {
        if (fail_) throw UploadError("bucket rejected " + key);
        std::lock_guard<std::mutex> lk(mutex_);
        objects_[key] = bytes;
        return "mem://" + key;
    }
    void setFail(bool fail) { fail_ = fail; }
    std::map<std::string, std::string> objects() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return objects_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> objects_;
    std::atomic<bool> fail_{false};
};

class RecordingSink : public ProgressSink {
public:
    void publish(const ProgressEvent& event) override {
        std::lock_guard<std::mutex> lk(mutex_);
        events_.push_back(event);
    }
    std::vector<ProgressEvent> events() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ProgressEvent> events_;
};

inline ElementSnapshot visible_box(const std::string& text) {
    ElementSnapshot s;
    s.display = "block";
    s.visibility = "visible";
    s.opacity = 1.0;
    s.width = 320;
    s.height = 200;
    s.text = text;
    return s;
}

} // namespace testing_support
} // namespace page_pilot
