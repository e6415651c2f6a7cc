#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace page_pilot {

enum class TaskStatus {
    Running,
    Paused,
    Completed,
    Failed
};

const char* to_string(TaskStatus status);

struct ProgressEvent {
    std::string task_id;
    TaskStatus status = TaskStatus::Running;
    int current_step_index = 0;
    int total_steps = 0;
    std::string message;
};

nlohmann::json to_json(const ProgressEvent& event);

// Outbound push contract; fire-and-forget.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void publish(const ProgressEvent& event) = 0;
};

// Writes events to stdout.
class LogProgressSink : public ProgressSink {
public:
    void publish(const ProgressEvent& event) override;
};

// Keeps the latest event per task and forwards every event to its sinks.
class ProgressReporter : public ProgressSink {
public:
    void addSink(std::shared_ptr<ProgressSink> sink);
    void publish(const ProgressEvent& event) override;

    // Latest event for `task_id`; false when none was published.
    bool latest(const std::string& task_id, ProgressEvent& out) const;
    std::map<std::string, ProgressEvent> snapshot() const;
    void forget(const std::string& task_id);

private:
    mutable std::mutex mutex_;
    std::map<std::string, ProgressEvent> latest_;
    std::vector<std::shared_ptr<ProgressSink>> sinks_;
};

} // namespace page_pilot
