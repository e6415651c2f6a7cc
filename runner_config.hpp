#pragma once

#include "blob_store.hpp"
#include "browser_process.hpp"
#include "interrupt_coordinator.hpp"
#include "workflow_interpreter.hpp"

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace page_pilot {

struct RunnerConfig {
    LaunchOptions browser;

    std::string blob_store_type = "file";   // "file" or "http"
    std::string blob_root = "./screenshots";
    HttpBlobStoreOptions http_blob;

    std::string control_url;                // empty: no control channel

    ChallengeConfig challenge;
    InterpreterOptions interpreter;

    unsigned max_parallel_tasks = 1;
};

// Overlays every field present in `j` onto `cfg_out`. Throws ConfigError.
void parse_config(const nlohmann::json& j, RunnerConfig& cfg_out);

// Logs and returns false when the file is missing or invalid.
bool load_config(const std::string& path, RunnerConfig& cfg_out);

// Throws ConfigError for an unknown store type.
std::unique_ptr<BlobStore> make_blob_store(const RunnerConfig& cfg);

} // namespace page_pilot
