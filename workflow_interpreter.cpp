#include "workflow_interpreter.hpp"

#include <chrono>
#include <iostream>
#include <thread>

namespace page_pilot {

using json = nlohmann::json;

json to_json(const ExecutionResult& result) {
    json out;
    out["taskId"] = result.task_id;
    out["status"] = to_string(result.status);
    out["data"] = result.data;
    out["screenshots"] = json::array();
    for (const auto& shot : result.screenshots) {
        out["screenshots"].push_back({{"name", shot.name}, {"url", shot.url}});
    }
    if (result.error) {
        const auto& e = *result.error;
        out["error"] = {
            {"kind", to_string(e.kind)},
            {"message", e.message},
            {"phase", e.phase},
            {"stepIndex", e.step_index},
            {"detail", e.detail},
        };
    }
    return out;
}

namespace {

std::string summary_for(ErrorKind kind, const std::string& phase) {
    switch (kind) {
        case ErrorKind::Timeout:
            if (phase == "navigateTo") return "navigation failed";
            if (phase == "waitForNetworkIdle") return "network did not go idle";
            return "element not found";
        case ErrorKind::StaleSession: return "page or browser closed";
        case ErrorKind::Protocol:     return "browser command failed";
        case ErrorKind::Script:       return "page script failed";
        case ErrorKind::Compositing:  return "screenshot stitching failed";
        case ErrorKind::Upload:       return "upload failed";
        case ErrorKind::Launch:       return "browser launch failed";
        case ErrorKind::PauseTimeout: return "challenge not resolved in time";
        case ErrorKind::Cancelled:    return "cancelled while paused";
        case ErrorKind::Internal:     break;
    }
    return "internal error";
}

ExecutionError make_error(ErrorKind kind, const std::string& phase, int index, const std::string& detail) {
    ExecutionError e;
    e.kind = kind;
    e.phase = phase;
    e.step_index = index;
    e.message = summary_for(kind, phase);
    e.detail = detail;
    return e;
}

std::string default_screenshot_name() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::to_string(ms) + "_screenshot.png";
}

void replace_all(std::string& text, const std::string& token, const std::string& value) {
    if (token.empty()) return;
    std::string::size_type pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

} // namespace

// Per-execution state.
struct WorkflowInterpreter::Run {
    std::string task_id;
    int total_steps = 0;
    std::shared_ptr<Page> page;
    ExecutionResult& result;
};

struct WorkflowInterpreter::StepDispatch {
    WorkflowInterpreter& self;
    Run& run;

    StepOutcome operator()(const NavigateTo& s) { self.navigate(run, s); return StepOutcome::success(); }
    StepOutcome operator()(const Wait& s) {
        std::this_thread::sleep_for(Millis(s.duration_ms));
        return StepOutcome::success();
    }
    StepOutcome operator()(const WaitForSelector& s) { self.waitFor(run, s); return StepOutcome::success(); }
    StepOutcome operator()(const Click& s) { self.click(run, s); return StepOutcome::success(); }
    StepOutcome operator()(const Screenshot& s) { self.screenshot(run, s); return StepOutcome::success(); }
    StepOutcome operator()(const ScrollRegion& s) { return self.scrollRegion(run, s); }
    StepOutcome operator()(const WaitForNetworkIdle&) { self.waitForNetworkIdle(run); return StepOutcome::success(); }
    StepOutcome operator()(const ExtractData& s) { return self.extractData(run, s); }
    StepOutcome operator()(const CompositeExtract& s) { return self.compositeExtract(run, s); }
};

WorkflowInterpreter::WorkflowInterpreter(SessionManager& sessions,
                                         BlobStore& blobs,
                                         InterruptCoordinator& interrupts,
                                         std::shared_ptr<ProgressSink> progress,
                                         InterpreterOptions options)
    : sessions_(sessions),
      blobs_(blobs),
      interrupts_(interrupts),
      progress_(std::move(progress)),
      options_(options),
      extraction_(options.selector_timeout),
      long_capture_(options.long_capture) {}

void WorkflowInterpreter::emit(const std::string& task_id, TaskStatus status, int step_index,
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

ExecutionResult WorkflowInterpreter::execute(const Workflow& workflow, const TaskContext& context,
                                             const std::string& task_id) {
    ExecutionResult result;
    result.task_id = task_id;

    const Workflow resolved = resolve_workflow(workflow, context);
    Run run{task_id, static_cast<int>(resolved.steps.size()), nullptr, result};

    emit(task_id, TaskStatus::Running, 0, run.total_steps, "acquiring browser page");
    try {
        run.page = sessions_.acquire();
    } catch (const BrowserError& e) {
        result.error = make_error(e.kind(), "session", -1, e.what());
    } catch (const std::exception& e) {
        result.error = make_error(ErrorKind::Launch, "session", -1, e.what());
    }
    if (result.error) {
        std::cerr << "[Interpreter] Task " << task_id << " could not get a page: " << result.error->detail << std::endl;
        result.status = TaskStatus::Failed;
        emit(task_id, TaskStatus::Failed, 0, run.total_steps, result.error->message);
        return result;
    }

    // Released on every path out of the loop.
    struct PageLease {
        SessionManager& sessions;
        std::shared_ptr<Page>& page;
        ~PageLease() { sessions.release(page); }
    } lease{sessions_, run.page};

    for (int i = 0; i < run.total_steps; ++i) {
        const Step& step = resolved.steps[static_cast<std::size_t>(i)];
        const std::string kind = step_kind(step);
        std::cout << "[Interpreter] Task " << task_id << " step " << i + 1 << "/" << run.total_steps
                  << ": " << kind << (step.description.empty() ? "" : " - " + step.description) << std::endl;
        emit(task_id, TaskStatus::Running, i, run.total_steps, step.description.empty() ? kind : step.description);

        StepOutcome outcome = runStep(run, step, i);
        if (outcome.status == StepOutcome::Status::Success) {
            outcome = checkpoint(run, step, i);
        }

        if (outcome.status == StepOutcome::Status::Recovered) {
            std::cerr << "[Interpreter] Step " << i << " (" << kind << ") recovered: " << outcome.note << std::endl;
        } else if (outcome.status == StepOutcome::Status::Failed) {
            result.status = TaskStatus::Failed;
            result.error = outcome.error;
            std::cerr << "[Interpreter] Task " << task_id << " failed at step " << i << " (" << kind << "): "
                      << outcome.error->message << " - " << outcome.error->detail << std::endl;
            emit(task_id, TaskStatus::Failed, i, run.total_steps, outcome.error->message);
            return result;
        }
    }

    result.status = TaskStatus::Completed;
    std::cout << "[Interpreter] Task " << task_id << " completed (" << result.data.size() << " values, "
              << result.screenshots.size() << " screenshots)" << std::endl;
    emit(task_id, TaskStatus::Completed, run.total_steps, run.total_steps, "completed");
    return result;
}

StepOutcome WorkflowInterpreter::runStep(Run& run, const Step& step, int index) {
    const std::string phase = step_kind(step);
    try {
        return std::visit(StepDispatch{*this, run}, step.action);
    } catch (const BrowserError& e) {
        return StepOutcome::failed(make_error(e.kind(), phase, index, e.what()));
    } catch (const UploadError& e) {
        return StepOutcome::failed(make_error(ErrorKind::Upload, phase, index, e.what()));
    } catch (const CompositingError& e) {
        return StepOutcome::failed(make_error(ErrorKind::Compositing, phase, index, e.what()));
    } catch (const ImageError& e) {
        return StepOutcome::failed(make_error(ErrorKind::Compositing, phase, index, e.what()));
    } catch (const std::exception& e) {
        return StepOutcome::failed(make_error(ErrorKind::Internal, phase, index, e.what()));
    }
}

StepOutcome WorkflowInterpreter::checkpoint(Run& run, const Step& step, int index) {
    const bool may_raise_challenge = std::holds_alternative<NavigateTo>(step.action)
        || std::holds_alternative<Click>(step.action)
        || std::holds_alternative<ScrollRegion>(step.action);
    if (!may_raise_challenge) return StepOutcome::success();

    const std::string phase = step_kind(step);
    try {
        switch (interrupts_.checkpoint(run.task_id, run.page, index, run.total_steps)) {
            case CheckpointResult::Clear:
            case CheckpointResult::Resumed:
                return StepOutcome::success();
            case CheckpointResult::TimedOut:
                return StepOutcome::failed(make_error(ErrorKind::PauseTimeout, phase, index,
                                                      "no resume received while a challenge was showing"));
            case CheckpointResult::Cancelled:
                return StepOutcome::failed(make_error(ErrorKind::Cancelled, phase, index,
                                                      "task cancelled while paused"));
        }
    } catch (const BrowserError& e) {
        return StepOutcome::failed(make_error(e.kind(), phase, index, e.what()));
    } catch (const std::logic_error& e) {
        return StepOutcome::failed(make_error(ErrorKind::Internal, phase, index, e.what()));
    }
    return StepOutcome::success();
}

// --------- Step handlers ---------
void WorkflowInterpreter::navigate(Run& run, const NavigateTo& step) {
    std::cout << "[Interpreter] Navigating to " << step.url << std::endl;
    run.page->navigate(step.url, options_.navigation_timeout);

    const std::string ready = step.ready_selector.value_or(options_.ready_selector);
    if (!ready.empty()) {
        run.page->waitForVisible(ready, options_.ready_timeout);
    }
}

void WorkflowInterpreter::waitFor(Run& run, const WaitForSelector& step) {
    run.page->waitForVisible(step.selector, options_.selector_timeout);
}

void WorkflowInterpreter::click(Run& run, const Click& step) {
    run.page->waitForVisible(step.selector, options_.selector_timeout);
    run.page->click(step.selector);
}

void WorkflowInterpreter::screenshot(Run& run, const Screenshot& step) {
    const std::string file_name = step.save_as.empty() ? default_screenshot_name() : step.save_as;

    std::string png;
    if (step.stitched) {
        png = long_capture_.capture(*run.page, step.selector);
    } else if (step.selector.empty()) {
        scrollToBottom(*run.page, "");
        png = run.page->captureFullPage();
    } else {
        run.page->waitForVisible(step.selector, options_.selector_timeout);
        png = run.page->captureElement(step.selector);
    }

    const std::string url = blobs_.upload(png, screenshot_object_key(run.task_id, file_name));
    run.result.screenshots.push_back(ScreenshotRef{file_name, url});
}

StepOutcome WorkflowInterpreter::scrollRegion(Run& run, const ScrollRegion& step) {
    try {
        scrollToBottom(*run.page, step.selector);
    } catch (const SessionClosedError&) {
        throw;
    } catch (const BrowserError& e) {
        return StepOutcome::recovered(std::string("scrolling stopped early: ") + e.what());
    }
    return StepOutcome::success();
}

void WorkflowInterpreter::scrollToBottom(Page& page, const std::string& selector) {
    std::cout << "[Interpreter] Scrolling " << (selector.empty() ? "whole page" : selector) << std::endl;
    if (!selector.empty()) {
        try {
            page.hover(selector);
        } catch (const ScriptError& e) {
            std::cerr << "[Interpreter] Scroll target " << selector << " not found, wheeling in place: " << e.what() << std::endl;
        }
    }

    int stable = 0;
    std::string last;
    for (int round = 0; round < options_.scroll_max_rounds; ++round) {
        std::string current = page.captureFullPage();
        if (!last.empty() && current == last) {
            ++stable;
        } else {
            stable = 0;
        }
        if (stable >= options_.scroll_stable_rounds) {
            std::cout << "[Interpreter] Page unchanged for " << stable << " rounds; bottom reached" << std::endl;
            return;
        }
        last = std::move(current);
        page.mouseWheel(options_.scroll_delta);
        std::this_thread::sleep_for(options_.scroll_settle);
    }
    std::cerr << "[Interpreter] Scrolling gave up after " << options_.scroll_max_rounds << " rounds" << std::endl;
}

void WorkflowInterpreter::waitForNetworkIdle(Run& run) {
    if (!run.page->waitForNetworkIdle(options_.network_idle, options_.network_idle_timeout)) {
        throw TimeoutError("network not idle for " + std::to_string(options_.network_idle.count()) +
                           " ms within " + std::to_string(options_.network_idle_timeout.count()) + " ms");
    }
}

StepOutcome WorkflowInterpreter::extractData(Run& run, const ExtractData& step) {
    ExtractionOutcome outcome = extraction_.extract(*run.page, step.selector);
    if (outcome.ok) {
        std::cout << "[Extract] " << step.name << " = " << outcome.value << std::endl;
        run.result.data[step.name] = outcome.value;
        return StepOutcome::success();
    }
    run.result.data[step.name] = kExtractionFailed;
    return StepOutcome::recovered(step.name + ": " + outcome.reason);
}

StepOutcome WorkflowInterpreter::compositeExtract(Run& run, const CompositeExtract& step) {
    std::string text = step.template_text;
    std::string misses;
    for (const auto& source : step.sources) {
        ExtractionOutcome outcome = extraction_.extract(*run.page, source.selector);
        if (!outcome.ok) {
            std::cerr << "[Extract] Source '" << source.name << "' failed: " << outcome.reason << std::endl;
            if (!misses.empty()) misses += ", ";
            misses += source.name;
        }
        replace_all(text, "${" + source.name + "}", outcome.ok ? outcome.value : std::string(kSourceNotFound));
    }
    run.result.data[step.name] = text;
    std::cout << "[Extract] " << step.name << " composed from " << step.sources.size() << " sources" << std::endl;
    if (!misses.empty()) return StepOutcome::recovered("unresolved sources: " + misses);
    return StepOutcome::success();
}

} // namespace page_pilot
