// Operator commands (WebSocket and console) and endpoint URL handling.
#include "control_channel.hpp"
#include "interrupt_coordinator.hpp"
#include "test_fakes.hpp"
#include "url.hpp"

#include <gtest/gtest.h>

#include <future>

using namespace page_pilot;
using namespace page_pilot::testing_support;
using json = nlohmann::json;

namespace {

const std::string kCaptcha = ".captcha_verify_container";

// Coordinator with one task parked on a visible challenge.
struct PausedTask {
    PausedTask() : coordinator(config(), nullptr), page(std::make_shared<FakePage>()) {
        page->setSnapshots(kCaptcha, {visible_box("captcha")});
        outcome = std::async(std::launch::async, [this] { return coordinator.checkpoint("t1", page, 0, 2); });
        for (int i = 0; i < 400 && !coordinator.isPaused("t1"); ++i) std::this_thread::sleep_for(Millis(5));
    }
    ~PausedTask() {
        coordinator.cancel("t1");
        if (outcome.valid()) outcome.wait();
    }

    static ChallengeConfig config() {
        ChallengeConfig c;
        c.pause_timeout = Millis(5000);
        return c;
    }

    InterruptCoordinator coordinator;
    std::shared_ptr<FakePage> page;
    std::future<CheckpointResult> outcome;
};

} // namespace

TEST(ControlMessages, ResumeIsAnsweredWithTheOutcome) {
    PausedTask task;
    ASSERT_TRUE(task.coordinator.isPaused("t1"));

    auto refused = dispatch_control_message(R"({"type":"task:resume","data":{"taskId":"t1"}})", task.coordinator);
    ASSERT_TRUE(refused.has_value());
    EXPECT_EQ((*refused)["type"], "task:resume:result");
    EXPECT_EQ((*refused)["data"]["accepted"], false);
    EXPECT_EQ((*refused)["data"]["reason"], "challenge still visible");

    task.page->setSnapshots(kCaptcha, {});
    auto accepted = dispatch_control_message(R"({"type":"task:resume","data":{"taskId":"t1"}})", task.coordinator);
    ASSERT_TRUE(accepted.has_value());
    EXPECT_EQ((*accepted)["data"]["taskId"], "t1");
    EXPECT_EQ((*accepted)["data"]["accepted"], true);
    EXPECT_FALSE((*accepted)["data"].contains("reason"));
    EXPECT_EQ(task.outcome.get(), CheckpointResult::Resumed);
}

TEST(ControlMessages, CancelAndUnknownInput) {
    PausedTask task;
    ASSERT_TRUE(task.coordinator.isPaused("t1"));

    auto reply = dispatch_control_message(R"({"type":"task:cancel","data":{"taskId":"t1"}})", task.coordinator);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["type"], "task:cancel:result");
    EXPECT_EQ((*reply)["data"]["cancelled"], true);
    EXPECT_EQ(task.outcome.get(), CheckpointResult::Cancelled);

    EXPECT_FALSE(dispatch_control_message("not json", task.coordinator).has_value());
    EXPECT_FALSE(dispatch_control_message(R"({"type":"task:teleport"})", task.coordinator).has_value());

    auto unknown = dispatch_control_message(R"({"type":"task:resume","data":{"taskId":42}})", task.coordinator);
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ((*unknown)["data"]["taskId"], "42");
    EXPECT_EQ((*unknown)["data"]["reason"], "task is not paused");
}

TEST(ConsoleCommands, StatusResumeAndCancel) {
    PausedTask task;
    ASSERT_TRUE(task.coordinator.isPaused("t1"));

    EXPECT_EQ(handle_console_command("status", task.coordinator), "paused: t1");
    EXPECT_EQ(handle_console_command("resume t1", task.coordinator), "t1: refused (challenge still visible)");
    EXPECT_EQ(handle_console_command("", task.coordinator), "t1: still blocked (challenge still visible)");
    EXPECT_EQ(handle_console_command("resume", task.coordinator), "usage: resume <taskId> | cancel <taskId> | status");
    EXPECT_EQ(handle_console_command("jump t1", task.coordinator), "unknown command 'jump'");

    task.page->setSnapshots(kCaptcha, {});
    EXPECT_EQ(handle_console_command("", task.coordinator), "t1: resumed");
    EXPECT_EQ(task.outcome.get(), CheckpointResult::Resumed);
    EXPECT_EQ(handle_console_command("status", task.coordinator), "no paused tasks");
    EXPECT_EQ(handle_console_command("cancel t1", task.coordinator), "t1: not paused");
}

TEST(Url, ParsesSchemesAndPorts) {
    ParsedUrl ws = parse_url("ws://127.0.0.1:9222/devtools/browser/abc");
    EXPECT_EQ(ws.host, "127.0.0.1");
    EXPECT_EQ(ws.port, 9222);
    EXPECT_EQ(ws.target, "/devtools/browser/abc");
    EXPECT_FALSE(ws.use_ssl);

    ParsedUrl wss = parse_url("wss://ops.example.com/ws-agent?id=1");
    EXPECT_EQ(wss.port, 443);
    EXPECT_TRUE(wss.use_ssl);
    EXPECT_EQ(wss.target, "/ws-agent?id=1");

    EXPECT_EQ(parse_url("http://storage.local").target, "/");
    EXPECT_EQ(parse_url("http://storage.local").port, 80);
}

TEST(Url, JoinsWithOneSlash) {
    EXPECT_EQ(join_url("https://s3.local/", "/shots"), "https://s3.local/shots");
    EXPECT_EQ(join_url("https://s3.local", "shots"), "https://s3.local/shots");
    EXPECT_EQ(join_url("", "shots"), "shots");
}
