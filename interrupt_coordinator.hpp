#pragma once

#include "page.hpp"
#include "progress.hpp"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace page_pilot {

struct ChallengeConfig {
    // Elements that may host a challenge. They are often present but hidden.
    std::vector<std::string> container_selectors = {
        ".captcha_verify_container", "#captcha_container", "[role=dialog]"};
    // A visible container counts only if its text contains one of these
    // (ASCII case-insensitive). Empty list: visibility alone counts.
    std::vector<std::string> keywords = {
        "验证", "滑块", "拖动", "captcha", "verify", "slider"};
    Millis pause_timeout = Millis(600000);
};

// Rendered means: not display:none, not visibility:hidden, non-zero opacity and a non-empty box.
bool is_rendered_visible(const ElementSnapshot& element);

class ChallengeDetector {
public:
    explicit ChallengeDetector(ChallengeConfig config) : config_(std::move(config)) {}

    // True when a rendered container carries challenge wording. A closed page
    // has no challenge. `matched` receives the container selector.
    bool detect(Page& page, std::string* matched = nullptr) const;
    bool matchesKeywords(const std::string& text) const;

    const ChallengeConfig& config() const { return config_; }

private:
    ChallengeConfig config_;
};

enum class CheckpointResult {
    Clear,      // no challenge, carry on
    Resumed,    // paused, then resumed after the challenge disappeared
    TimedOut,   // nobody resumed within the pause timeout
    Cancelled
};

struct ResumeResult {
    bool accepted = false;
    std::string reason;
};

// Parks a task on a detected challenge until an operator resolves it.
//
// Each paused task owns one PauseHandle whose promise is fulfilled exactly
// once, by resume() after its re-check, by cancel(), or abandoned on timeout.
class InterruptCoordinator {
public:
    InterruptCoordinator(ChallengeConfig config, std::shared_ptr<ProgressSink> progress);

    // Blocks the calling task while a challenge is showing on `page`.
    CheckpointResult checkpoint(const std::string& task_id, const std::shared_ptr<Page>& page,
                                int step_index, int total_steps);

    // Refused while the challenge is still visible or when the task is not paused.
    ResumeResult resume(const std::string& task_id);
    bool cancel(const std::string& task_id);

    bool isPaused(const std::string& task_id) const;
    std::vector<std::string> pausedTasks() const;

    const ChallengeDetector& detector() const { return detector_; }

private:
    enum class Signal { Resume, Cancel };

    struct PauseHandle {
        std::promise<Signal> signal;
        std::weak_ptr<Page> page;
    };

    void emit(const std::string& task_id, TaskStatus status, int step_index, int total_steps,
              const std::string& message);

    ChallengeDetector detector_;
    std::shared_ptr<ProgressSink> progress_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PauseHandle>> paused_;
};

} // namespace page_pilot
