#pragma once

#include "workflow.hpp"
#include "workflow_interpreter.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace page_pilot {

constexpr std::size_t kMaxBatchSize = 10;

struct TaskRequest {
    std::string task_id;
    TaskContext parameters;
};

struct BatchSummary {
    std::vector<ExecutionResult> results;   // input order
    std::size_t total = 0;
    std::size_t successful = 0;
};

nlohmann::json to_json(const BatchSummary& summary);

// Runs single tasks or batches of inputs against one workflow.
class TaskRunner {
public:
    explicit TaskRunner(WorkflowInterpreter& interpreter, unsigned max_parallel = 1)
        : interpreter_(interpreter), max_parallel_(max_parallel == 0 ? 1 : max_parallel) {}

    // `taskId` is added to the parameters for placeholder use.
    ExecutionResult run(const Workflow& workflow, const TaskRequest& request);

    // Each input is bound to the workflow's input key. Task ids are
    // <batch_id>-<n>. Throws ConfigError for an empty or oversized batch.
    BatchSummary runBatch(const Workflow& workflow,
                          const std::vector<std::string>& inputs,
                          const std::string& batch_id,
                          const TaskContext& shared_parameters = {});

private:
    WorkflowInterpreter& interpreter_;
    unsigned max_parallel_;
};

} // namespace page_pilot
