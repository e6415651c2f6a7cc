#include "task_runner.hpp"
#include "errors.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <thread>

namespace page_pilot {

using json = nlohmann::json;

json to_json(const BatchSummary& summary) {
    json results = json::array();
    for (const auto& r : summary.results) results.push_back(to_json(r));
    return {
        {"total", summary.total},
        {"successful", summary.successful},
        {"results", results},
    };
}

ExecutionResult TaskRunner::run(const Workflow& workflow, const TaskRequest& request) {
    TaskContext context = request.parameters;
    context["taskId"] = request.task_id;
    return interpreter_.execute(workflow, context, request.task_id);
}

BatchSummary TaskRunner::runBatch(const Workflow& workflow,
                                  const std::vector<std::string>& inputs,
                                  const std::string& batch_id,
                                  const TaskContext& shared_parameters) {
    if (inputs.empty()) {
        throw ConfigError("batch has no inputs");
    }
    if (inputs.size() > kMaxBatchSize) {
        throw ConfigError("batch of " + std::to_string(inputs.size()) + " exceeds the limit of " +
                          std::to_string(kMaxBatchSize));
    }

    std::vector<TaskRequest> requests;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        TaskRequest req;
        req.task_id = batch_id + "-" + std::to_string(i + 1);
        req.parameters = shared_parameters;
        req.parameters[workflow.input_key] = inputs[i];
        requests.push_back(std::move(req));
    }

    BatchSummary summary;
    summary.total = requests.size();
    summary.results.resize(requests.size());

    const unsigned workers = std::min<unsigned>(max_parallel_, static_cast<unsigned>(requests.size()));
    std::cout << "[Runner] Batch " << batch_id << ": " << requests.size() << " tasks, "
              << workers << " at a time" << std::endl;

    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        for (std::size_t i = next++; i < requests.size(); i = next++) {
            summary.results[i] = run(workflow, requests[i]);
        }
    };

    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        for (unsigned w = 0; w < workers; ++w) pool.emplace_back(worker);
        for (auto& t : pool) t.join();
    }

    for (const auto& r : summary.results) {
        if (r.completed()) ++summary.successful;
    }
    std::cout << "[Runner] Batch " << batch_id << " done: " << summary.successful << "/" << summary.total
              << " completed" << std::endl;
    return summary;
}

} // namespace page_pilot
