#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace page_pilot {

// --------- Step kinds ---------
struct NavigateTo {
    std::string url;
    // Unset: the interpreter's default ready marker. Empty: no ready wait.
    std::optional<std::string> ready_selector;
};

struct Wait {
    long duration_ms = 1000;
};

struct WaitForSelector {
    std::string selector;
};

struct Click {
    std::string selector;
};

struct Screenshot {
    std::string selector;   // empty: scroll the whole page, then capture it
    bool stitched = false;
    std::string save_as;    // empty: <epoch-ms>_screenshot.png
};

struct ScrollRegion {
    std::string selector;   // empty: whole page
};

struct WaitForNetworkIdle {};

struct ExtractData {
    std::string selector;
    std::string name;
};

struct ExtractSource {
    std::string name;
    std::string selector;
};

// `template_text` refers to sources as ${name}.
struct CompositeExtract {
    std::string template_text;
    std::vector<ExtractSource> sources;
    std::string name;
};

using StepAction = std::variant<NavigateTo, Wait, WaitForSelector, Click, Screenshot,
                                ScrollRegion, WaitForNetworkIdle, ExtractData, CompositeExtract>;

struct Step {
    StepAction action;
    std::string description;
};

struct Workflow {
    std::string name;
    std::string input_key = "xingtuId";
    std::vector<Step> steps;
};

// Placeholder name -> value for one run.
using TaskContext = std::map<std::string, std::string>;

// Action name as written in workflow documents ("navigateTo", "extractData", ...).
const char* step_kind(const Step& step);

// Throws ConfigError on a malformed document or an unknown action.
Workflow parse_workflow(const nlohmann::json& doc);
Workflow load_workflow(const std::string& path);

// Replaces every {{name}} whose name is in `context`; unknown tokens stay as written.
std::string substitute_placeholders(const std::string& text, const TaskContext& context);

// Copy of `workflow` with placeholders substituted into every string field.
Workflow resolve_workflow(const Workflow& workflow, const TaskContext& context);

} // namespace page_pilot
