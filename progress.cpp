#include "progress.hpp"

#include <iostream>

namespace page_pilot {

const char* to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Running:   return "running";
        case TaskStatus::Paused:    return "paused";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
    }
    return "running";
}

nlohmann::json to_json(const ProgressEvent& event) {
    return {
        {"taskId", event.task_id},
        {"status", to_string(event.status)},
        {"currentStepIndex", event.current_step_index},
        {"totalSteps", event.total_steps},
        {"message", event.message},
    };
}

void LogProgressSink::publish(const ProgressEvent& event) {
    std::cout << "[Progress] task=" << event.task_id
              << " " << to_string(event.status)
              << " step " << event.current_step_index << "/" << event.total_steps;
    if (!event.message.empty()) std::cout << " - " << event.message;
    std::cout << std::endl;
}

void ProgressReporter::addSink(std::shared_ptr<ProgressSink> sink) {
    std::lock_guard<std::mutex> lk(mutex_);
    sinks_.push_back(std::move(sink));
}

void ProgressReporter::publish(const ProgressEvent& event) {
    std::vector<std::shared_ptr<ProgressSink>> sinks;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        latest_[event.task_id] = event;
        sinks = sinks_;
    }
    for (auto& sink : sinks) {
        try {
            sink->publish(event);
        } catch (const std::exception& e) {
            std::cerr << "[Progress] sink failed for task " << event.task_id << ": " << e.what() << std::endl;
        }
    }
}

bool ProgressReporter::latest(const std::string& task_id, ProgressEvent& out) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = latest_.find(task_id);
    if (it == latest_.end()) return false;
    out = it->second;
    return true;
}

std::map<std::string, ProgressEvent> ProgressReporter::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return latest_;
}

void ProgressReporter::forget(const std::string& task_id) {
    std::lock_guard<std::mutex> lk(mutex_);
    latest_.erase(task_id);
}

} // namespace page_pilot
