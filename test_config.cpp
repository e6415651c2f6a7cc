// Runner configuration, blob stores and browser command lines.
#include "blob_store.hpp"
#include "browser_process.hpp"
#include "errors.hpp"
#include "progress.hpp"
#include "runner_config.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace page_pilot;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("page_pilot_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

bool has_arg(const std::vector<std::string>& argv, const std::string& arg) {
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

} // namespace

TEST(RunnerConfig, DefaultsWithoutAFile) {
    RunnerConfig cfg;
    EXPECT_EQ(cfg.browser.profile_dir, "./user_data_agent");
    EXPECT_EQ(cfg.interpreter.navigation_timeout, Millis(60000));
    EXPECT_EQ(cfg.interpreter.selector_timeout, Millis(15000));
    EXPECT_EQ(cfg.interpreter.network_idle_timeout, Millis(60000));
    EXPECT_EQ(cfg.interpreter.long_capture.network_idle_timeout, Millis(10000));
    EXPECT_EQ(cfg.interpreter.long_capture.overlap, 50.0);
    EXPECT_EQ(cfg.challenge.pause_timeout, Millis(600000));
    EXPECT_EQ(cfg.max_parallel_tasks, 1u);
}

TEST(RunnerConfig, OverlaysPresentFields) {
    RunnerConfig cfg;
    parse_config(json::parse(R"({
        "browser": {"executable": "/opt/chrome", "profile_dir": "/data/profile", "headless": true,
                    "extra_args": ["--lang=zh-CN"], "env": {"DISPLAY": ":1"}},
        "blob_store": {"type": "http", "endpoint": "https://s3.local", "bucket": "shots"},
        "control": {"url": "wss://ops.local/ws"},
        "challenge": {"keywords": [], "pause_timeout_sec": 30},
        "timeouts": {"navigation_ms": 1000, "selector_ms": 2000},
        "capture": {"overlap_px": 20, "max_tiles": 12},
        "scroll": {"delta_px": 400, "stable_rounds": 5},
        "max_parallel_tasks": 3
    })"), cfg);

    EXPECT_EQ(cfg.browser.executable, "/opt/chrome");
    EXPECT_EQ(cfg.browser.profile_dir, "/data/profile");
    EXPECT_TRUE(cfg.browser.headless);
    EXPECT_EQ(cfg.browser.extra_args, std::vector<std::string>{"--lang=zh-CN"});
    EXPECT_EQ(cfg.browser.env.at("DISPLAY"), ":1");
    EXPECT_EQ(cfg.blob_store_type, "http");
    EXPECT_EQ(cfg.http_blob.bucket, "shots");
    EXPECT_EQ(cfg.control_url, "wss://ops.local/ws");
    EXPECT_TRUE(cfg.challenge.keywords.empty());
    EXPECT_EQ(cfg.challenge.pause_timeout, Millis(30000));
    EXPECT_EQ(cfg.interpreter.navigation_timeout, Millis(1000));
    EXPECT_EQ(cfg.interpreter.long_capture.selector_timeout, Millis(2000));
    EXPECT_EQ(cfg.interpreter.long_capture.overlap, 20.0);
    EXPECT_EQ(cfg.interpreter.long_capture.max_tiles, 12u);
    EXPECT_EQ(cfg.interpreter.scroll_stable_rounds, 5);
    EXPECT_EQ(cfg.max_parallel_tasks, 3u);
    // Untouched fields keep their defaults.
    EXPECT_EQ(cfg.interpreter.ready_selector, "#layout-content");
}

TEST(RunnerConfig, RejectsBadValues) {
    RunnerConfig cfg;
    EXPECT_THROW(parse_config(json::parse(R"({"timeouts": {"navigation_ms": "slow"}})"), cfg), ConfigError);
    EXPECT_THROW(parse_config(json::parse(R"({"capture": {"overlap_px": -1}})"), cfg), ConfigError);
    RunnerConfig other;
    EXPECT_THROW(parse_config(json::parse(R"({"scroll": {"stable_rounds": 0}})"), other), ConfigError);
}

TEST(RunnerConfig, LoadConfigReportsFailures) {
    fs::path dir = scratch_dir("config");
    RunnerConfig cfg;
    EXPECT_FALSE(load_config((dir / "missing.json").string(), cfg));

    std::ofstream(dir / "broken.json") << "{ not json";
    EXPECT_FALSE(load_config((dir / "broken.json").string(), cfg));

    std::ofstream(dir / "ok.json") << R"({"ready_selector": "#app"})";
    EXPECT_TRUE(load_config((dir / "ok.json").string(), cfg));
    EXPECT_EQ(cfg.interpreter.ready_selector, "#app");
    fs::remove_all(dir);
}

TEST(BlobStore, FactoryPicksTheConfiguredStore) {
    RunnerConfig cfg;
    EXPECT_NE(dynamic_cast<FileBlobStore*>(make_blob_store(cfg).get()), nullptr);

    cfg.blob_store_type = "http";
    EXPECT_THROW(make_blob_store(cfg), ConfigError);   // no endpoint
    cfg.http_blob.endpoint = "https://s3.local";
    EXPECT_NE(dynamic_cast<HttpBlobStore*>(make_blob_store(cfg).get()), nullptr);

    cfg.blob_store_type = "ftp";
    EXPECT_THROW(make_blob_store(cfg), ConfigError);
}

TEST(BlobStore, FileStoreWritesUnderTheObjectKey) {
    fs::path dir = scratch_dir("blobs");
    FileBlobStore store(dir.string());
    const std::string key = screenshot_object_key("task-1", "a.png");
    EXPECT_EQ(key, "automation_screenshots/task-1/a.png");

    std::string url = store.upload("png-bytes", key);
    EXPECT_EQ(url.rfind("file://", 0), 0u);

    std::ifstream in(dir / key, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "png-bytes");
    fs::remove_all(dir);
}

TEST(BrowserArgv, CarriesProfileAndPort) {
    LaunchOptions opts;
    opts.executable = "/opt/chrome";
    opts.profile_dir = "/data/profile";
    opts.debug_port = 9333;
    opts.extra_args = {"--lang=zh-CN"};

    auto argv = build_browser_argv(opts);
    ASSERT_FALSE(argv.empty());
    EXPECT_EQ(argv.front(), "/opt/chrome");
    EXPECT_TRUE(has_arg(argv, "--remote-debugging-port=9333"));
    EXPECT_TRUE(has_arg(argv, "--user-data-dir=/data/profile"));
    EXPECT_TRUE(has_arg(argv, "--lang=zh-CN"));
    EXPECT_FALSE(has_arg(argv, "--headless=new"));

    opts.headless = true;
    EXPECT_TRUE(has_arg(build_browser_argv(opts), "--headless=new"));
}

TEST(SpawnProcess, RunsTheArgvAndTerminates) {
    EXPECT_THROW(spawn_process(SpawnSpec{}), LaunchError);

    SpawnSpec spec;
    spec.argv = {"/bin/sleep", "30"};
    spec.env = {{"PAGE_PILOT_CHILD", "1"}};
    ChildProcess child = spawn_process(spec);
    EXPECT_GT(child.pid(), 0);
    EXPECT_TRUE(child.running());

    child.terminate(500);
    EXPECT_FALSE(child.running());
    EXPECT_EQ(child.pid(), -1);
}

TEST(ProgressReporter, KeepsTheLatestEventPerTask) {
    ProgressReporter reporter;
    auto sink = std::make_shared<testing_support::RecordingSink>();
    reporter.addSink(sink);

    ProgressEvent e;
    e.task_id = "t1";
    e.total_steps = 3;
    reporter.publish(e);
    e.current_step_index = 2;
    e.status = TaskStatus::Paused;
    reporter.publish(e);

    ProgressEvent latest;
    ASSERT_TRUE(reporter.latest("t1", latest));
    EXPECT_EQ(latest.status, TaskStatus::Paused);
    EXPECT_EQ(latest.current_step_index, 2);
    EXPECT_EQ(sink->events().size(), 2u);
    EXPECT_FALSE(reporter.latest("t2", latest));

    json j = to_json(latest);
    EXPECT_EQ(j["status"], "paused");
    EXPECT_EQ(j["currentStepIndex"], 2);

    reporter.forget("t1");
    EXPECT_TRUE(reporter.snapshot().empty());
}
