#include "cdp_page.hpp"
#include "errors.hpp"

#include <boost/beast/core/detail/base64.hpp>

#include <iostream>
#include <thread>

namespace page_pilot {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

namespace {

// JS string literal for a selector.
std::string js_quote(const std::string& s) {
    return json(s).dump();
}

std::string element_expr(const std::string& selector) {
    return "document.querySelector(" + js_quote(selector) + ")";
}

constexpr Millis kPollInterval{100};

} // namespace

std::string decode_base64(const std::string& encoded) {
    namespace b64 = boost::beast::detail::base64;
    std::string out;
    out.resize(b64::decoded_size(encoded.size()));
    auto result = b64::decode(&out[0], encoded.data(), encoded.size());
    out.resize(result.first);
    return out;
}

CdpPage::CdpPage(std::shared_ptr<CdpConnection> conn, std::string target_id, std::string session_id)
    : conn_(std::move(conn)),
      target_id_(std::move(target_id)),
      session_id_(std::move(session_id)),
      events_(std::make_shared<EventState>()) {
    std::shared_ptr<EventState> state = events_;
    conn_->subscribe(session_id_, [state](const std::string& method, const json& params) {
        onEvent(*state, method, params);
    });
}

CdpPage::~CdpPage() {
    conn_->unsubscribe(session_id_);
}

void CdpPage::enableDomains() {
    call("Page.enable");
    call("Runtime.enable");
    call("Network.enable");
}

void CdpPage::onEvent(EventState& state, const std::string& method, const json& params) {
    {
        std::lock_guard<std::mutex> lk(state.mutex);
        if (method == "Network.requestWillBeSent") {
            state.inflight.insert(params.value("requestId", ""));
            state.last_activity = Clock::now();
        } else if (method == "Network.loadingFinished" || method == "Network.loadingFailed") {
            state.inflight.erase(params.value("requestId", ""));
            state.last_activity = Clock::now();
        } else if (method == "Page.loadEventFired") {
            ++state.load_events;
        } else if (method == "Target.detachedFromTarget" || method == "Inspector.detached" ||
                   method == "Inspector.targetCrashed") {
            state.detached = true;
        } else {
            return;
        }
    }
    state.cv.notify_all();
}

json CdpPage::call(const std::string& method, const json& params, Millis timeout) {
    if (isClosed()) {
        throw SessionClosedError("page is closed (" + method + ")");
    }
    return conn_->send(method, params, session_id_, timeout);
}

// --------- Navigation & waits ---------
void CdpPage::navigate(const std::string& url, Millis timeout) {
    const auto deadline = Clock::now() + timeout;
    unsigned long loads_before;
    {
        std::lock_guard<std::mutex> lk(events_->mutex);
        loads_before = events_->load_events;
    }

    json result = call("Page.navigate", {{"url", url}}, timeout);
    const std::string error_text = result.value("errorText", "");
    if (!error_text.empty()) {
        throw ProtocolError("navigation to " + url + " failed: " + error_text);
    }

    {
        std::unique_lock<std::mutex> lk(events_->mutex);
        bool loaded = events_->cv.wait_until(lk, deadline, [&] {
            return events_->load_events > loads_before || events_->detached;
        });
        if (events_->detached) throw SessionClosedError("page detached while loading " + url);
        if (!loaded) throw TimeoutError("navigation to " + url + " timed out");
    }

    // Let the initial burst of XHRs settle; a busy page is not an error here.
    const auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now());
    if (left.count() > 0 && !waitForNetworkIdle(Millis(500), left)) {
        std::cout << "[CDP] " << url << " still busy after load" << std::endl;
    }
}

void CdpPage::waitForVisible(const std::string& selector, Millis timeout) {
    const std::string expr =
        "(() => { const el = " + element_expr(selector) + ";"
        " if (!el) return false;"
        " const s = getComputedStyle(el); const r = el.getBoundingClientRect();"
        " return s.visibility !== 'hidden' && s.display !== 'none' && r.width > 0 && r.height > 0; })()";

    const auto deadline = Clock::now() + timeout;
    while (true) {
        if (evaluate(expr) == true) return;
        if (Clock::now() >= deadline) {
            throw TimeoutError("waiting for selector `" + selector + "` failed: " +
                               std::to_string(timeout.count()) + "ms exceeded");
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

bool CdpPage::waitForNetworkIdle(Millis idle, Millis timeout) {
    const auto deadline = Clock::now() + timeout;
    std::unique_lock<std::mutex> lk(events_->mutex);
    while (true) {
        if (events_->detached) throw SessionClosedError("page detached while waiting for network idle");
        const auto now = Clock::now();
        if (events_->inflight.empty() && now - events_->last_activity >= idle) return true;
        if (now >= deadline) return false;
        events_->cv.wait_for(lk, Millis(50));
    }
}

// --------- Input ---------
std::pair<double, double> CdpPage::elementCenter(const std::string& selector) {
    json rect = evaluate(
        "(() => { const el = " + element_expr(selector) + ";"
        " if (!el) return null;"
        " el.scrollIntoView({block: 'center', inline: 'center'});"
        " const r = el.getBoundingClientRect();"
        " return {x: r.left + r.width / 2, y: r.top + r.height / 2}; })()");
    if (rect.is_null()) {
        throw ScriptError("no element matches `" + selector + "`");
    }
    return {rect.value("x", 0.0), rect.value("y", 0.0)};
}

void CdpPage::moveMouse(double x, double y) {
    call("Input.dispatchMouseEvent", {{"type", "mouseMoved"}, {"x", x}, {"y", y}});
    mouse_x_ = x;
    mouse_y_ = y;
}

void CdpPage::click(const std::string& selector) {
    auto center = elementCenter(selector);
    moveMouse(center.first, center.second);
    json press = {{"type", "mousePressed"}, {"x", center.first}, {"y", center.second},
                  {"button", "left"}, {"clickCount", 1}};
    call("Input.dispatchMouseEvent", press);
    press["type"] = "mouseReleased";
    call("Input.dispatchMouseEvent", press);
}

void CdpPage::hover(const std::string& selector) {
    auto center = elementCenter(selector);
    moveMouse(center.first, center.second);
}

void CdpPage::mouseWheel(double delta_y) {
    call("Input.dispatchMouseEvent", {{"type", "mouseWheel"}, {"x", mouse_x_}, {"y", mouse_y_},
                                      {"deltaX", 0}, {"deltaY", delta_y}});
}

// --------- Evaluation ---------
json CdpPage::evaluate(const std::string& expression) {
    json result = call("Runtime.evaluate", {{"expression", expression},
                                            {"returnByValue", true},
                                            {"awaitPromise", true}});
    if (result.contains("exceptionDetails")) {
        const auto& details = result["exceptionDetails"];
        std::string message = details.value("text", "script exception");
        if (details.contains("exception") && details["exception"].contains("description")) {
            message = details["exception"]["description"].get<std::string>();
        }
        throw ScriptError(message);
    }
    const json& value = result.value("result", json::object());
    return value.value("value", json());
}

std::string CdpPage::textContent(const std::string& selector) {
    json text = evaluate("(() => { const el = " + element_expr(selector) + ";"
                          " return el ? (el.textContent || '') : null; })()");
    if (!text.is_string()) {
        throw ScriptError("no element matches `" + selector + "`");
    }
    return text.get<std::string>();
}

std::vector<ElementSnapshot> CdpPage::inspect(const std::string& selector) {
    json items = evaluate(
        "Array.from(document.querySelectorAll(" + js_quote(selector) + ")).map(el => {"
        " const s = getComputedStyle(el); const r = el.getBoundingClientRect();"
        " return {display: s.display, visibility: s.visibility, opacity: parseFloat(s.opacity),"
        " width: r.width, height: r.height,"
        " text: (el.innerText || el.textContent || '').replace(/\\s+/g, ' ').trim()}; })");

    std::vector<ElementSnapshot> out;
    if (!items.is_array()) return out;
    for (const auto& item : items) {
        ElementSnapshot snap;
        snap.display = item.value("display", "");
        snap.visibility = item.value("visibility", "");
        snap.opacity = item.value("opacity", 1.0);
        snap.width = item.value("width", 0.0);
        snap.height = item.value("height", 0.0);
        snap.text = item.value("text", "");
        out.push_back(std::move(snap));
    }
    return out;
}

ScrollMetrics CdpPage::scrollMetrics(const std::string& selector) {
    json m = evaluate("(() => { const el = " + element_expr(selector) + ";"
                      " return el ? {top: el.scrollTop, height: el.scrollHeight, client: el.clientHeight} : null; })()");
    if (m.is_null()) {
        throw ScriptError("no element matches `" + selector + "`");
    }
    ScrollMetrics out;
    out.scroll_top = m.value("top", 0.0);
    out.scroll_height = m.value("height", 0.0);
    out.client_height = m.value("client", 0.0);
    return out;
}

void CdpPage::scrollBy(const std::string& selector, double delta_y) {
    json ok = evaluate("(() => { const el = " + element_expr(selector) + ";"
                       " if (!el) return false; el.scrollTop = el.scrollTop + " + std::to_string(delta_y) + ";"
                       " return true; })()");
    if (ok != true) {
        throw ScriptError("no element matches `" + selector + "`");
    }
}

double CdpPage::devicePixelRatio() {
    json dpr = evaluate("window.devicePixelRatio");
    return dpr.is_number() ? dpr.get<double>() : 1.0;
}

// --------- Capture ---------
std::string CdpPage::screenshot(const json& params) {
    json result = call("Page.captureScreenshot", params, std::chrono::seconds(60));
    std::string png = decode_base64(result.value("data", ""));
    if (png.empty()) {
        throw ProtocolError("Page.captureScreenshot returned no image data");
    }
    return png;
}

std::string CdpPage::captureElement(const std::string& selector) {
    json box = evaluate("(() => { const el = " + element_expr(selector) + ";"
                        " if (!el) return null;"
                        " el.scrollIntoView({block: 'nearest', inline: 'nearest'});"
                        " const r = el.getBoundingClientRect();"
                        " return {x: r.left + window.scrollX, y: r.top + window.scrollY, w: r.width, h: r.height}; })()");
    if (box.is_null()) {
        throw ScriptError("no element matches `" + selector + "`");
    }
    if (box.value("w", 0.0) <= 0.0 || box.value("h", 0.0) <= 0.0) {
        throw ScriptError("element `" + selector + "` has an empty box");
    }
    json clip = {{"x", box["x"]}, {"y", box["y"]}, {"width", box["w"]}, {"height", box["h"]}, {"scale", 1}};
    return screenshot({{"format", "png"}, {"clip", clip}, {"captureBeyondViewport", true}});
}

std::string CdpPage::captureViewport() {
    return screenshot({{"format", "png"}});
}

std::string CdpPage::captureFullPage() {
    json metrics = call("Page.getLayoutMetrics");
    json size = metrics.contains("cssContentSize") ? metrics["cssContentSize"] : metrics.value("contentSize", json::object());
    json clip = {{"x", 0}, {"y", 0},
                 {"width", size.value("width", 0.0)}, {"height", size.value("height", 0.0)},
                 {"scale", 1}};
    return screenshot({{"format", "png"}, {"clip", clip}, {"captureBeyondViewport", true}});
}

// --------- Lifecycle ---------
bool CdpPage::isClosed() const {
    if (closed_ || !conn_->isConnected()) return true;
    std::lock_guard<std::mutex> lk(events_->mutex);
    return events_->detached;
}

void CdpPage::close() {
    if (closed_.exchange(true)) return;
    if (!conn_->isConnected()) return;
    try {
        conn_->send("Target.closeTarget", {{"targetId", target_id_}});
    } catch (const BrowserError& e) {
        std::cerr << "[CDP] closeTarget " << target_id_ << ": " << e.what() << std::endl;
    }
}

} // namespace page_pilot
