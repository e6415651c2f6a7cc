#pragma once

#include <map>
#include <string>
#include <vector>
#include <sys/types.h> // pid_t

namespace page_pilot {

// How to start the browser process.
struct SpawnSpec {
    std::vector<std::string> argv;         // full argv (argv[0] is the executable)
    std::map<std::string,std::string> env; // environment vars to set/override
};

// Browser launch settings. `profile_dir` is handed to the browser untouched.
struct LaunchOptions {
    std::string executable = "/usr/bin/google-chrome";
    std::string profile_dir = "./user_data_agent";
    unsigned debug_port = 9222;
    bool headless = false;
    int window_width = 2560;
    int window_height = 1440;
    std::vector<std::string> extra_args;
    std::map<std::string,std::string> env;
    unsigned launch_timeout_ms = 30000;
};

std::vector<std::string> build_browser_argv(const LaunchOptions& opts);

// A spawned child; terminates it on destruction unless released.
class ChildProcess {
public:
    ChildProcess() = default;
    explicit ChildProcess(pid_t pid) : pid_(pid) {}
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    pid_t pid() const { return pid_; }
    bool running() const;
    // SIGTERM, then SIGKILL after `grace_ms`; reaps the child.
    void terminate(unsigned grace_ms = 3000);

private:
    pid_t pid_ = -1;
};

// Throws LaunchError when fork/exec setup fails.
ChildProcess spawn_process(const SpawnSpec& spec);

} // namespace page_pilot
