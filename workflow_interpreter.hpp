#pragma once

#include "blob_store.hpp"
#include "errors.hpp"
#include "extraction_engine.hpp"
#include "interrupt_coordinator.hpp"
#include "long_capture.hpp"
#include "progress.hpp"
#include "session_manager.hpp"
#include "workflow.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace page_pilot {

struct ExecutionError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;   // what went wrong, in user terms
    std::string phase;     // step kind, or "session" before the first step
    int step_index = -1;
    std::string detail;    // diagnostic text from the failing component
};

struct ScreenshotRef {
    std::string name;
    std::string url;
};

struct ExecutionResult {
    std::string task_id;
    TaskStatus status = TaskStatus::Completed;   // Completed or Failed
    std::map<std::string, std::string> data;
    std::vector<ScreenshotRef> screenshots;
    std::optional<ExecutionError> error;

    bool completed() const { return status == TaskStatus::Completed; }
};

nlohmann::json to_json(const ExecutionResult& result);

// What one step did; the interpreter loop branches on `status`.
struct StepOutcome {
    enum class Status { Success, Recovered, Failed };

    Status status = Status::Success;
    std::string note;                    // why a step was recovered
    std::optional<ExecutionError> error; // set when Failed

    static StepOutcome success() { return StepOutcome(); }
    static StepOutcome recovered(std::string note) {
        StepOutcome o;
        o.status = Status::Recovered;
        o.note = std::move(note);
        return o;
    }
    static StepOutcome failed(ExecutionError error) {
        StepOutcome o;
        o.status = Status::Failed;
        o.error = std::move(error);
        return o;
    }
};

struct InterpreterOptions {
    Millis navigation_timeout = Millis(60000);
    std::string ready_selector = "#layout-content";
    Millis ready_timeout = Millis(20000);
    Millis selector_timeout = Millis(15000);
    Millis network_idle = Millis(1000);
    Millis network_idle_timeout = Millis(60000);

    double scroll_delta = 800.0;
    Millis scroll_settle = Millis(1500);
    int scroll_stable_rounds = 3;
    int scroll_max_rounds = 200;

    LongCaptureOptions long_capture;
};

// Runs one workflow against one page.
class WorkflowInterpreter {
public:
    WorkflowInterpreter(SessionManager& sessions,
                        BlobStore& blobs,
                        InterruptCoordinator& interrupts,
                        std::shared_ptr<ProgressSink> progress,
                        InterpreterOptions options = InterpreterOptions());

    // Never throws; every failure lands in the result.
    ExecutionResult execute(const Workflow& workflow, const TaskContext& context, const std::string& task_id);

private:
    struct Run;
    struct StepDispatch;

    StepOutcome runStep(Run& run, const Step& step, int index);
    StepOutcome checkpoint(Run& run, const Step& step, int index);

    void navigate(Run& run, const NavigateTo& step);
    void waitFor(Run& run, const WaitForSelector& step);
    void click(Run& run, const Click& step);
    void screenshot(Run& run, const Screenshot& step);
    StepOutcome scrollRegion(Run& run, const ScrollRegion& step);
    void waitForNetworkIdle(Run& run);
    StepOutcome extractData(Run& run, const ExtractData& step);
    StepOutcome compositeExtract(Run& run, const CompositeExtract& step);

    // Scrolls until the page looks the same for `scroll_stable_rounds` captures in a row.
    void scrollToBottom(Page& page, const std::string& selector);

    void emit(const std::string& task_id, TaskStatus status, int step_index, int total_steps,
              const std::string& message);

    SessionManager& sessions_;
    BlobStore& blobs_;
    InterruptCoordinator& interrupts_;
    std::shared_ptr<ProgressSink> progress_;
    InterpreterOptions options_;
    ExtractionEngine extraction_;
    LongCapture long_capture_;
};

} // namespace page_pilot
