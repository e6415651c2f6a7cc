#include "runner_config.hpp"
#include "errors.hpp"

#include <fstream>
#include <iostream>

namespace page_pilot {

using json = nlohmann::json;

namespace {

std::vector<std::string> string_list(const json& arr) {
    std::vector<std::string> out;
    for (const auto& a : arr) out.push_back(a.get<std::string>());
    return out;
}

void parse_browser(const json& jb, LaunchOptions& b) {
    if (jb.contains("executable")) b.executable = jb["executable"].get<std::string>();
    if (jb.contains("profile_dir")) b.profile_dir = jb["profile_dir"].get<std::string>();
    if (jb.contains("debug_port")) b.debug_port = jb["debug_port"].get<unsigned>();
    if (jb.contains("headless")) b.headless = jb["headless"].get<bool>();
    if (jb.contains("window_width")) b.window_width = jb["window_width"].get<int>();
    if (jb.contains("window_height")) b.window_height = jb["window_height"].get<int>();
    if (jb.contains("launch_timeout_ms")) b.launch_timeout_ms = jb["launch_timeout_ms"].get<unsigned>();
    if (jb.contains("extra_args") && jb["extra_args"].is_array()) b.extra_args = string_list(jb["extra_args"]);
    if (jb.contains("env") && jb["env"].is_object()) {
        for (auto it = jb["env"].begin(); it != jb["env"].end(); ++it) {
            b.env[it.key()] = it.value().get<std::string>();
        }
    }
}

void parse_blob_store(const json& js, RunnerConfig& cfg) {
    if (js.contains("type")) cfg.blob_store_type = js["type"].get<std::string>();
    if (js.contains("root_dir")) cfg.blob_root = js["root_dir"].get<std::string>();
    if (js.contains("endpoint")) cfg.http_blob.endpoint = js["endpoint"].get<std::string>();
    if (js.contains("bucket")) cfg.http_blob.bucket = js["bucket"].get<std::string>();
    if (js.contains("public_base_url")) cfg.http_blob.public_base_url = js["public_base_url"].get<std::string>();
    if (js.contains("auth_env")) cfg.http_blob.auth_env = js["auth_env"].get<std::string>();
    if (js.contains("timeout_ms")) cfg.http_blob.timeout = Millis(js["timeout_ms"].get<long>());
}

void parse_challenge(const json& jc, ChallengeConfig& c) {
    if (jc.contains("container_selectors") && jc["container_selectors"].is_array()) {
        c.container_selectors = string_list(jc["container_selectors"]);
    }
    if (jc.contains("keywords") && jc["keywords"].is_array()) c.keywords = string_list(jc["keywords"]);
    if (jc.contains("pause_timeout_sec")) c.pause_timeout = std::chrono::seconds(jc["pause_timeout_sec"].get<long>());
}

void parse_timeouts(const json& jt, InterpreterOptions& o) {
    if (jt.contains("navigation_ms")) o.navigation_timeout = Millis(jt["navigation_ms"].get<long>());
    if (jt.contains("ready_ms")) o.ready_timeout = Millis(jt["ready_ms"].get<long>());
    if (jt.contains("selector_ms")) {
        o.selector_timeout = Millis(jt["selector_ms"].get<long>());
        o.long_capture.selector_timeout = o.selector_timeout;
    }
    if (jt.contains("network_idle_ms")) o.network_idle = Millis(jt["network_idle_ms"].get<long>());
    if (jt.contains("network_idle_timeout_ms")) o.network_idle_timeout = Millis(jt["network_idle_timeout_ms"].get<long>());
    if (jt.contains("capture_idle_ms")) o.long_capture.network_idle = Millis(jt["capture_idle_ms"].get<long>());
    if (jt.contains("capture_idle_timeout_ms")) o.long_capture.network_idle_timeout = Millis(jt["capture_idle_timeout_ms"].get<long>());
}

} // namespace

void parse_config(const json& j, RunnerConfig& cfg_out) {
    try {
        if (j.contains("browser") && j["browser"].is_object()) parse_browser(j["browser"], cfg_out.browser);
        if (j.contains("blob_store") && j["blob_store"].is_object()) parse_blob_store(j["blob_store"], cfg_out);
        if (j.contains("control") && j["control"].is_object() && j["control"].contains("url")) {
            cfg_out.control_url = j["control"]["url"].get<std::string>();
        }
        if (j.contains("challenge") && j["challenge"].is_object()) parse_challenge(j["challenge"], cfg_out.challenge);
        if (j.contains("timeouts") && j["timeouts"].is_object()) parse_timeouts(j["timeouts"], cfg_out.interpreter);
        if (j.contains("ready_selector")) cfg_out.interpreter.ready_selector = j["ready_selector"].get<std::string>();

        if (j.contains("capture") && j["capture"].is_object()) {
            const json& jc = j["capture"];
            if (jc.contains("overlap_px")) cfg_out.interpreter.long_capture.overlap = jc["overlap_px"].get<double>();
            if (jc.contains("max_tiles")) cfg_out.interpreter.long_capture.max_tiles = jc["max_tiles"].get<std::size_t>();
        }
        if (j.contains("scroll") && j["scroll"].is_object()) {
            const json& js = j["scroll"];
            if (js.contains("delta_px")) cfg_out.interpreter.scroll_delta = js["delta_px"].get<double>();
            if (js.contains("settle_ms")) cfg_out.interpreter.scroll_settle = Millis(js["settle_ms"].get<long>());
            if (js.contains("stable_rounds")) cfg_out.interpreter.scroll_stable_rounds = js["stable_rounds"].get<int>();
            if (js.contains("max_rounds")) cfg_out.interpreter.scroll_max_rounds = js["max_rounds"].get<int>();
        }
        if (j.contains("max_parallel_tasks")) cfg_out.max_parallel_tasks = j["max_parallel_tasks"].get<unsigned>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("bad config value: ") + e.what());
    }

    if (cfg_out.interpreter.long_capture.overlap < 0) throw ConfigError("capture.overlap_px must be >= 0");
    if (cfg_out.interpreter.long_capture.max_tiles == 0) throw ConfigError("capture.max_tiles must be > 0");
    if (cfg_out.interpreter.scroll_stable_rounds < 1) throw ConfigError("scroll.stable_rounds must be >= 1");
    if (cfg_out.max_parallel_tasks == 0) cfg_out.max_parallel_tasks = 1;
}

bool load_config(const std::string& path, RunnerConfig& cfg_out) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[Config] Cannot open: " << path << "\n";
        return false;
    }
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "[Config] Not a JSON object: " << path << "\n";
        return false;
    }
    try {
        parse_config(j, cfg_out);
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << path << ": " << e.what() << "\n";
        return false;
    }
    std::cout << "[Config] Loaded " << path << "\n";
    return true;
}

std::unique_ptr<BlobStore> make_blob_store(const RunnerConfig& cfg) {
    if (cfg.blob_store_type == "file") {
        return std::make_unique<FileBlobStore>(cfg.blob_root);
    }
    if (cfg.blob_store_type == "http") {
        return std::make_unique<HttpBlobStore>(cfg.http_blob);
    }
    throw ConfigError("unknown blob_store.type '" + cfg.blob_store_type + "'");
}

} // namespace page_pilot
