#include "workflow.hpp"
#include "errors.hpp"

#include <fstream>
#include <iostream>

namespace page_pilot {

using json = nlohmann::json;

namespace {

std::string require_string(const json& js, const char* field, const std::string& action) {
    if (!js.contains(field) || !js[field].is_string()) {
        throw ConfigError("step '" + action + "' needs string field '" + field + "'");
    }
    return js[field].get<std::string>();
}

std::string optional_string(const json& js, const char* field) {
    if (js.contains(field) && js[field].is_string()) return js[field].get<std::string>();
    return "";
}

Step parse_step(const json& js, std::size_t index) {
    if (!js.is_object() || !js.contains("action") || !js["action"].is_string()) {
        throw ConfigError("step " + std::to_string(index) + " has no action");
    }
    const std::string action = js["action"].get<std::string>();

    Step step;
    step.description = optional_string(js, "description");

    if (action == "navigateTo" || action == "navigate" || action == "goto") {
        NavigateTo nav;
        nav.url = require_string(js, "url", action);
        if (js.contains("readySelector") && js["readySelector"].is_string()) {
            nav.ready_selector = js["readySelector"].get<std::string>();
        }
        step.action = nav;
    } else if (action == "wait") {
        Wait w;
        if (js.contains("milliseconds")) w.duration_ms = js["milliseconds"].get<long>();
        if (w.duration_ms < 0) throw ConfigError("step 'wait' has a negative duration");
        step.action = w;
    } else if (action == "waitForSelector") {
        step.action = WaitForSelector{require_string(js, "selector", action)};
    } else if (action == "click") {
        step.action = Click{require_string(js, "selector", action)};
    } else if (action == "screenshot") {
        Screenshot shot;
        shot.selector = optional_string(js, "selector");
        if (js.contains("stitched")) shot.stitched = js["stitched"].get<bool>();
        shot.save_as = optional_string(js, "saveAs");
        if (shot.stitched && shot.selector.empty()) {
            throw ConfigError("stitched screenshot needs a selector");
        }
        step.action = shot;
    } else if (action == "scrollPage" || action == "scrollRegion") {
        step.action = ScrollRegion{optional_string(js, "selector")};
    } else if (action == "waitForNetworkIdle") {
        step.action = WaitForNetworkIdle{};
    } else if (action == "extractData") {
        step.action = ExtractData{require_string(js, "selector", action), require_string(js, "dataName", action)};
    } else if (action == "compositeExtract") {
        CompositeExtract comp;
        comp.template_text = require_string(js, "template", action);
        comp.name = require_string(js, "dataName", action);
        if (!js.contains("sources") || !js["sources"].is_array()) {
            throw ConfigError("step 'compositeExtract' needs a sources array");
        }
        for (const auto& src : js["sources"]) {
            comp.sources.push_back(ExtractSource{require_string(src, "name", action),
                                                 require_string(src, "selector", action)});
        }
        step.action = comp;
    } else {
        throw ConfigError("step " + std::to_string(index) + " has unknown action '" + action + "'");
    }
    return step;
}

// Applies placeholder substitution to every string field of one step kind.
struct StepResolver {
    const TaskContext& ctx;

    std::string sub(const std::string& s) const { return substitute_placeholders(s, ctx); }

    StepAction operator()(const NavigateTo& s) const {
        NavigateTo out{sub(s.url), s.ready_selector};
        if (out.ready_selector) out.ready_selector = sub(*out.ready_selector);
        return out;
    }
    StepAction operator()(const Wait& s) const { return s; }
    StepAction operator()(const WaitForSelector& s) const { return WaitForSelector{sub(s.selector)}; }
    StepAction operator()(const Click& s) const { return Click{sub(s.selector)}; }
    StepAction operator()(const Screenshot& s) const {
        return Screenshot{sub(s.selector), s.stitched, sub(s.save_as)};
    }
    StepAction operator()(const ScrollRegion& s) const { return ScrollRegion{sub(s.selector)}; }
    StepAction operator()(const WaitForNetworkIdle& s) const { return s; }
    StepAction operator()(const ExtractData& s) const { return ExtractData{sub(s.selector), sub(s.name)}; }
    StepAction operator()(const CompositeExtract& s) const {
        CompositeExtract out;
        out.template_text = sub(s.template_text);
        out.name = sub(s.name);
        for (const auto& src : s.sources) out.sources.push_back(ExtractSource{sub(src.name), sub(src.selector)});
        return out;
    }
};

struct KindName {
    const char* operator()(const NavigateTo&) const { return "navigateTo"; }
    const char* operator()(const Wait&) const { return "wait"; }
    const char* operator()(const WaitForSelector&) const { return "waitForSelector"; }
    const char* operator()(const Click&) const { return "click"; }
    const char* operator()(const Screenshot&) const { return "screenshot"; }
    const char* operator()(const ScrollRegion&) const { return "scrollPage"; }
    const char* operator()(const WaitForNetworkIdle&) const { return "waitForNetworkIdle"; }
    const char* operator()(const ExtractData&) const { return "extractData"; }
    const char* operator()(const CompositeExtract&) const { return "compositeExtract"; }
};

} // namespace

const char* step_kind(const Step& step) {
    return std::visit(KindName{}, step.action);
}

Workflow parse_workflow(const json& doc) {
    if (!doc.is_object()) throw ConfigError("workflow document must be a JSON object");

    Workflow wf;
    wf.name = optional_string(doc, "name");
    for (const char* section : {"inputConfig", "requiredInput"}) {
        if (doc.contains(section) && doc[section].is_object() && doc[section].contains("key")) {
            wf.input_key = optional_string(doc[section], "key");
            break;
        }
    }

    if (!doc.contains("steps") || !doc["steps"].is_array()) {
        throw ConfigError("workflow needs a steps array");
    }
    const json& steps = doc["steps"];
    for (std::size_t i = 0; i < steps.size(); ++i) {
        try {
            wf.steps.push_back(parse_step(steps[i], i));
        } catch (const json::exception& e) {
            throw ConfigError("step " + std::to_string(i) + ": " + e.what());
        }
    }
    return wf;
}

Workflow load_workflow(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigError("cannot open workflow " + path);
    }
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigError("workflow " + path + " is not valid JSON");
    }
    Workflow wf = parse_workflow(j);
    std::cout << "[Config] Loaded workflow '" << wf.name << "' (" << wf.steps.size() << " steps) from " << path << std::endl;
    return wf;
}

std::string substitute_placeholders(const std::string& text, const TaskContext& context) {
    std::string out;
    out.reserve(text.size());
    std::string::size_type pos = 0;
    while (pos < text.size()) {
        const auto first = text.find("{{", pos);
        if (first == std::string::npos) break;
        const auto close = text.find("}}", first + 2);
        if (close == std::string::npos) break;
        // Innermost opener, so "{{ {{name}}" still resolves name.
        const auto open = text.rfind("{{", close - 1);

        out.append(text, pos, open - pos);
        const std::string name = text.substr(open + 2, close - open - 2);
        auto it = context.find(name);
        if (it != context.end()) {
            out += it->second;
        } else {
            out.append(text, open, close + 2 - open);
        }
        pos = close + 2;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

Workflow resolve_workflow(const Workflow& workflow, const TaskContext& context) {
    Workflow out;
    out.name = workflow.name;
    out.input_key = workflow.input_key;
    StepResolver resolver{context};
    for (const auto& step : workflow.steps) {
        out.steps.push_back(Step{std::visit(resolver, step.action), substitute_placeholders(step.description, context)});
    }
    return out;
}

} // namespace page_pilot
