#include "browser_process.hpp"
#include "errors.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <thread>
#include <stdlib.h>     // setenv
#include <sys/wait.h>
#include <unistd.h>     // fork, execvp

namespace page_pilot {

std::vector<std::string> build_browser_argv(const LaunchOptions& opts) {
    std::vector<std::string> argv = {
        opts.executable,
        "--remote-debugging-port=" + std::to_string(opts.debug_port),
        "--user-data-dir=" + opts.profile_dir,
        "--no-first-run",
        "--no-default-browser-check",
        "--window-size=" + std::to_string(opts.window_width) + "," + std::to_string(opts.window_height),
    };
    if (opts.headless) {
        argv.push_back("--headless=new");
    } else {
        argv.push_back("--start-maximized");
    }
    argv.insert(argv.end(), opts.extra_args.begin(), opts.extra_args.end());
    argv.push_back("about:blank");
    return argv;
}

// --------------------------- ChildProcess ------------------------------------
ChildProcess::~ChildProcess() {
    if (pid_ > 0) terminate();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept : pid_(other.pid_) {
    other.pid_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0) terminate();
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

bool ChildProcess::running() const {
    if (pid_ <= 0) return false;
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    return r == 0;
}

void ChildProcess::terminate(unsigned grace_ms) {
    if (pid_ <= 0) return;
    if (kill(pid_, SIGTERM) == 0) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            int status = 0;
            if (waitpid(pid_, &status, WNOHANG) != 0) {
                pid_ = -1;
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        std::cerr << "[Spawn] pid=" << pid_ << " ignored SIGTERM, killing\n";
        kill(pid_, SIGKILL);
    }
    int status = 0;
    waitpid(pid_, &status, 0);
    pid_ = -1;
}

// --------------------------- process spawn -----------------------------------
ChildProcess spawn_process(const SpawnSpec& spec) {
    if (spec.argv.empty()) {
        throw LaunchError("empty argv; nothing to exec");
    }

    std::vector<char*> cargv;
    cargv.reserve(spec.argv.size() + 1);
    for (const auto& s : spec.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        throw LaunchError(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        for (const auto& kv : spec.env) {
            ::setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }
        execvp(cargv[0], cargv.data());
        perror("execvp");
        _exit(127);
    }

    std::cout << "[Spawn] pid=" << pid << " command:";
    for (const auto& arg : spec.argv) std::cout << " " << arg;
    std::cout << "\n";
    return ChildProcess(pid);
}

} // namespace page_pilot
