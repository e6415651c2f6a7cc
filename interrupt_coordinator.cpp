#include "interrupt_coordinator.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace page_pilot {

namespace {

std::string ascii_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

} // namespace

bool is_rendered_visible(const ElementSnapshot& element) {
    return element.display != "none"
        && element.visibility != "hidden"
        && element.opacity > 0.0
        && element.width > 0.0
        && element.height > 0.0;
}

// --------------------------- ChallengeDetector -------------------------------
bool ChallengeDetector::matchesKeywords(const std::string& text) const {
    if (config_.keywords.empty()) return true;
    const std::string haystack = ascii_lower(text);
    for (const auto& keyword : config_.keywords) {
        if (!keyword.empty() && haystack.find(ascii_lower(keyword)) != std::string::npos) return true;
    }
    return false;
}

bool ChallengeDetector::detect(Page& page, std::string* matched) const {
    if (page.isClosed()) return false;

    for (const auto& selector : config_.container_selectors) {
        std::vector<ElementSnapshot> elements;
        try {
            elements = page.inspect(selector);
        } catch (const SessionClosedError&) {
            return false;
        } catch (const BrowserError& e) {
            std::cerr << "[Interrupt] Could not inspect " << selector << ": " << e.what() << std::endl;
            continue;
        }

        for (const auto& el : elements) {
            if (!is_rendered_visible(el)) continue;
            if (!matchesKeywords(el.text)) {
                std::cout << "[Interrupt] Visible " << selector << " has no challenge wording; ignoring" << std::endl;
                continue;
            }
            if (matched) *matched = selector;
            return true;
        }
    }
    return false;
}

// --------------------------- InterruptCoordinator ----------------------------
InterruptCoordinator::InterruptCoordinator(ChallengeConfig config, std::shared_ptr<ProgressSink> progress)
    : detector_(std::move(config)), progress_(std::move(progress)) {}

void InterruptCoordinator::emit(const std::string& task_id, TaskStatus status, int step_index,
                                int total_steps, const std::string& message) {
    if (!progress_) return;
    ProgressEvent event;
    event.task_id = task_id;
    event.status = status;
    event.current_step_index = step_index;
    event.total_steps = total_steps;
    event.message = message;
    progress_->publish(event);
}

CheckpointResult InterruptCoordinator::checkpoint(const std::string& task_id, const std::shared_ptr<Page>& page,
                                                  int step_index, int total_steps) {
    std::string container;
    if (!page || !detector_.detect(*page, &container)) {
        return CheckpointResult::Clear;
    }

    auto handle = std::make_shared<PauseHandle>();
    handle->page = page;
    std::future<Signal> signal = handle->signal.get_future();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (paused_.count(task_id)) {
            throw std::logic_error("task " + task_id + " is already paused");
        }
        paused_[task_id] = handle;
    }

    std::cout << "[Interrupt] Task " << task_id << " paused on challenge " << container << std::endl;
    emit(task_id, TaskStatus::Paused, step_index, total_steps, "challenge detected: " + container);

    const auto timeout = detector_.config().pause_timeout;
    if (signal.wait_for(timeout) != std::future_status::ready) {
        bool still_ours = false;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            auto it = paused_.find(task_id);
            if (it != paused_.end() && it->second == handle) {
                paused_.erase(it);
                still_ours = true;
            }
        }
        // Whoever removed the entry has already fulfilled the signal.
        if (still_ours) {
            std::cerr << "[Interrupt] Task " << task_id << " not resumed within "
                      << timeout.count() << " ms" << std::endl;
            return CheckpointResult::TimedOut;
        }
    }

    if (signal.get() == Signal::Cancel) {
        std::cout << "[Interrupt] Task " << task_id << " cancelled while paused" << std::endl;
        return CheckpointResult::Cancelled;
    }

    std::cout << "[Interrupt] Task " << task_id << " resumed" << std::endl;
    emit(task_id, TaskStatus::Running, step_index, total_steps, "resumed");
    return CheckpointResult::Resumed;
}

ResumeResult InterruptCoordinator::resume(const std::string& task_id) {
    std::shared_ptr<PauseHandle> handle;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = paused_.find(task_id);
        if (it == paused_.end()) return {false, "task is not paused"};
        handle = it->second;
    }

    // Re-check outside the lock; it talks to the browser.
    std::shared_ptr<Page> page = handle->page.lock();
    if (page && detector_.detect(*page)) {
        std::cout << "[Interrupt] Resume refused for " << task_id << ": challenge still visible" << std::endl;
        return {false, "challenge still visible"};
    }

    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = paused_.find(task_id);
        if (it == paused_.end() || it->second != handle) return {false, "task is not paused"};
        paused_.erase(it);
        handle->signal.set_value(Signal::Resume);
    }
    return {true, ""};
}

bool InterruptCoordinator::cancel(const std::string& task_id) {
    std::shared_ptr<PauseHandle> handle;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = paused_.find(task_id);
        if (it == paused_.end()) return false;
        handle = it->second;
        paused_.erase(it);
        handle->signal.set_value(Signal::Cancel);
    }
    return true;
}

bool InterruptCoordinator::isPaused(const std::string& task_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return paused_.count(task_id) > 0;
}

std::vector<std::string> InterruptCoordinator::pausedTasks() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> out;
    for (const auto& kv : paused_) out.push_back(kv.first);
    return out;
}

} // namespace page_pilot
