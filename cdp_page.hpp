#pragma once

#include "cdp_connection.hpp"
#include "page.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace page_pilot {

// Page driven over a flattened CDP target session.
class CdpPage : public Page {
public:
    using json = nlohmann::json;

    CdpPage(std::shared_ptr<CdpConnection> conn, std::string target_id, std::string session_id);
    ~CdpPage() override;

    // Page / Runtime / Network domains; called once before handing the page out.
    void enableDomains();

    void navigate(const std::string& url, Millis timeout) override;
    void waitForVisible(const std::string& selector, Millis timeout) override;
    void click(const std::string& selector) override;
    void hover(const std::string& selector) override;
    void mouseWheel(double delta_y) override;

    std::string textContent(const std::string& selector) override;
    json evaluate(const std::string& expression) override;
    std::vector<ElementSnapshot> inspect(const std::string& selector) override;

    ScrollMetrics scrollMetrics(const std::string& selector) override;
    void scrollBy(const std::string& selector, double delta_y) override;
    double devicePixelRatio() override;

    std::string captureElement(const std::string& selector) override;
    std::string captureViewport() override;
    std::string captureFullPage() override;

    bool waitForNetworkIdle(Millis idle, Millis timeout) override;

    bool isClosed() const override;
    void close() override;

    const std::string& targetId() const { return target_id_; }

private:
    // Shared with the event handler so late events never touch a destroyed page.
    struct EventState {
        std::mutex mutex;
        std::condition_variable cv;
        std::set<std::string> inflight;
        std::chrono::steady_clock::time_point last_activity = std::chrono::steady_clock::now();
        unsigned long load_events = 0;
        bool detached = false;
    };

    static void onEvent(EventState& state, const std::string& method, const json& params);

    json call(const std::string& method, const json& params = json::object(),
              Millis timeout = std::chrono::seconds(30));
    // Center of the element's box in viewport coordinates, after scrolling it into view.
    std::pair<double, double> elementCenter(const std::string& selector);
    void moveMouse(double x, double y);
    std::string screenshot(const json& params);

    std::shared_ptr<CdpConnection> conn_;
    std::string target_id_;
    std::string session_id_;
    std::shared_ptr<EventState> events_;
    std::atomic<bool> closed_{false};
    double mouse_x_ = 0.0;
    double mouse_y_ = 0.0;
};

// Decodes CDP's base64 screenshot payload.
std::string decode_base64(const std::string& encoded);

} // namespace page_pilot
