// main.cpp - page_pilot command line runner.
// Runs one workflow for a single task or a batch of inputs and prints the result as JSON.
//
// Example config (config.json):
// {
//   "browser": {
//     "executable": "/usr/bin/google-chrome",
//     "profile_dir": "./user_data_agent",         // logged-in state, reused across runs
//     "debug_port": 9222,
//     "headless": false,
//     "env": { "DISPLAY": ":0" }
//   },
//   "blob_store": {
//     "type": "http",                             // or "file" with "root_dir"
//     "endpoint": "https://storage.example.com",
//     "bucket": "screenshots",
//     "public_base_url": "https://screenshots.storage.example.com",
//     "auth_env": "BLOB_AUTHORIZATION"
//   },
//   "control": { "url": "wss://ops.example.com/ws-agent" },
//   "challenge": { "keywords": ["captcha", "verify"], "pause_timeout_sec": 600 },
//   "timeouts": { "navigation_ms": 60000, "selector_ms": 15000 },
//   "capture": { "overlap_px": 50, "max_tiles": 200 },
//   "scroll": { "delta_px": 800, "settle_ms": 1500, "stable_rounds": 3 },
//   "max_parallel_tasks": 1
// }
//
// Run:
//   ./page_pilot --config ./config.json --workflow ./author.json --input 7012345678901234567
//
// Batch (up to 10 inputs) with an operator console for challenges:
//   ./page_pilot --workflow ./author.json --input A --input B --interactive --out result.json

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "chrome_browser.hpp"
#include "control_channel.hpp"
#include "errors.hpp"
#include "progress.hpp"
#include "runner_config.hpp"
#include "session_manager.hpp"
#include "task_runner.hpp"
#include "workflow.hpp"
#include "workflow_interpreter.hpp"

using json = nlohmann::json;

namespace page_pilot {

static std::atomic<bool> g_interrupted{false};

static void handle_signal(int) { g_interrupted = true; }

static void print_usage(const char* argv0) {
    std::cerr <<
    "Usage:\n"
    "  " << argv0 << " --workflow FILE.json\n"
    "               [--config FILE.json]\n"
    "               [--task-id ID] [--param KEY=VALUE]...\n"
    "               [--input VALUE]...            (repeat for a batch, max 10)\n"
    "               [--profile-dir DIR] [--headless]\n"
    "               [--out FILE] [--interactive]\n";
}

static std::string epoch_id(const char* prefix) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::string(prefix) + std::to_string(ms);
}

// Reads operator commands from stdin until EOF.
static void run_console(InterruptCoordinator& coordinator) {
    std::cout << "[Console] Commands: resume <taskId> | cancel <taskId> | status | <Enter> resumes all paused tasks" << std::endl;
    std::string line;
    while (std::getline(std::cin, line)) {
        std::cout << "[Console] " << handle_console_command(line, coordinator) << std::endl;
    }
}

} // namespace page_pilot

int main(int argc, char** argv) {
    using namespace page_pilot;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    RunnerConfig cfg;
    std::optional<std::string> config_path;
    std::optional<std::string> profile_dir;
    std::string workflow_path;
    std::string task_id;
    std::string out_path;
    TaskContext params;
    std::vector<std::string> inputs;
    bool headless = false;
    bool interactive = false;

    // -------------------------- CLI parse --------------------------
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto need = [&](const char* name) {
            if (i + 1 >= argc) { std::cerr << name << " requires value\n"; print_usage(argv[0]); std::exit(2); }
            return std::string(argv[++i]);
        };
        if (a == "--config") config_path = need("--config");
        else if (a == "--workflow") workflow_path = need("--workflow");
        else if (a == "--task-id") task_id = need("--task-id");
        else if (a == "--param") {
            std::string kv = need("--param");
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) { std::cerr << "--param expects KEY=VALUE\n"; return 2; }
            params[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
        else if (a == "--input") inputs.push_back(need("--input"));
        else if (a == "--profile-dir") profile_dir = need("--profile-dir");
        else if (a == "--headless") headless = true;
        else if (a == "--out") out_path = need("--out");
        else if (a == "--interactive") interactive = true;
        else if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
        else { std::cerr << "Unknown arg: " << a << "\n"; print_usage(argv[0]); return 2; }
    }
    if (workflow_path.empty()) {
        std::cerr << "--workflow is required\n";
        print_usage(argv[0]);
        return 2;
    }

    // -------------------------- Load config (optional) --------------------------
    if (config_path && !load_config(*config_path, cfg)) {
        return 2;
    }
    if (profile_dir) cfg.browser.profile_dir = *profile_dir;
    if (headless) cfg.browser.headless = true;

    Workflow workflow;
    std::unique_ptr<BlobStore> blobs;
    try {
        workflow = load_workflow(workflow_path);
        blobs = make_blob_store(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << e.what() << "\n";
        return 2;
    }

    // -------------------------- Wire components --------------------------
    auto progress = std::make_shared<ProgressReporter>();
    progress->addSink(std::make_shared<LogProgressSink>());

    InterruptCoordinator interrupts(cfg.challenge, progress);

    std::shared_ptr<ControlChannel> control;
    if (!cfg.control_url.empty()) {
        control = std::make_shared<ControlChannel>(interrupts);
        if (control->connect(cfg.control_url)) {
            progress->addSink(control);
        } else {
            std::cerr << "[Control] Continuing without operator channel" << std::endl;
        }
    }

    SessionManager sessions(std::make_shared<ChromeLauncher>(), cfg.browser);
    WorkflowInterpreter interpreter(sessions, *blobs, interrupts, progress, cfg.interpreter);
    TaskRunner runner(interpreter, cfg.max_parallel_tasks);

    if (interactive) {
        // Blocks in getline; it cannot be joined, so it dies with the process.
        std::thread(run_console, std::ref(interrupts)).detach();
    }

    std::atomic<bool> finished{false};
    std::thread signal_watch([&]() {
        while (!finished) {
            if (g_interrupted) {
                std::cerr << "[Runner] Interrupted; cancelling paused tasks and closing the browser" << std::endl;
                for (const auto& id : interrupts.pausedTasks()) interrupts.cancel(id);
                sessions.shutdown();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    // -------------------------- Run --------------------------
    json output;
    bool all_completed = false;
    try {
        if (inputs.empty()) {
            TaskRequest request{task_id.empty() ? epoch_id("task-") : task_id, params};
            ExecutionResult result = runner.run(workflow, request);
            all_completed = result.completed();
            output = to_json(result);
        } else {
            BatchSummary summary = runner.runBatch(workflow, inputs, task_id.empty() ? epoch_id("batch-") : task_id, params);
            all_completed = summary.successful == summary.total;
            output = to_json(summary);
        }
    } catch (const ConfigError& e) {
        std::cerr << "[Runner] " << e.what() << std::endl;
        finished = true;
        signal_watch.join();
        return 2;
    }

    finished = true;
    signal_watch.join();
    sessions.shutdown();
    if (control) control->disconnect();

    std::cout << output.dump(2) << std::endl;
    if (!out_path.empty()) {
        std::ofstream out(out_path);
        if (!out) {
            std::cerr << "[Runner] Cannot write " << out_path << std::endl;
            return 1;
        }
        out << output.dump(2) << "\n";
    }
    return all_completed ? 0 : 1;
}
