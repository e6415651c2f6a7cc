#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace page_pilot {

using Millis = std::chrono::milliseconds;

// Scroll state of one element, in CSS (logical) pixels.
struct ScrollMetrics {
    double scroll_top = 0.0;
    double scroll_height = 0.0;
    double client_height = 0.0;
};

// Computed-style snapshot of one element, enough to decide whether it is really rendered.
struct ElementSnapshot {
    std::string display;       // computed `display`
    std::string visibility;    // computed `visibility`
    double      opacity = 1.0;
    double      width = 0.0;   // bounding client rect
    double      height = 0.0;
    std::string text;          // normalized innerText
};

// One browser tab owned by a single task.
//
// All operations throw BrowserError subclasses on failure: TimeoutError when a
// wait expires, SessionClosedError once the tab or browser is gone.
// Image-returning operations return encoded PNG bytes.
class Page {
public:
    virtual ~Page() = default;

    virtual void navigate(const std::string& url, Millis timeout) = 0;
    virtual void waitForVisible(const std::string& selector, Millis timeout) = 0;
    virtual void click(const std::string& selector) = 0;
    virtual void hover(const std::string& selector) = 0;
    virtual void mouseWheel(double delta_y) = 0;

    virtual std::string textContent(const std::string& selector) = 0;
    // Evaluates an expression in the page and returns its JSON value.
    virtual nlohmann::json evaluate(const std::string& expression) = 0;
    // Snapshots every element matching `selector` (possibly none).
    virtual std::vector<ElementSnapshot> inspect(const std::string& selector) = 0;

    virtual ScrollMetrics scrollMetrics(const std::string& selector) = 0;
    virtual void scrollBy(const std::string& selector, double delta_y) = 0;
    virtual double devicePixelRatio() = 0;

    virtual std::string captureElement(const std::string& selector) = 0;
    virtual std::string captureViewport() = 0;
    virtual std::string captureFullPage() = 0;

    // Returns false when no quiet window of `idle` occurred before `timeout`.
    virtual bool waitForNetworkIdle(Millis idle, Millis timeout) = 0;

    virtual bool isClosed() const = 0;
    virtual void close() = 0;
};

} // namespace page_pilot
