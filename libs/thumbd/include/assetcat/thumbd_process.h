#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace assetcat::thumbd {

// ChildProcess runs one external renderer. stdin, stdout and stderr are
// redirected to /dev/null. The destructor kills a child that is still running.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Launch program (looked up on PATH). Returns false if fork fails.
    // A program that cannot be executed exits with status 127.
    bool launch(const std::string& program, const std::vector<std::string>& args);

    bool running() const;

    // Check if the child has exited (non-blocking). Returns true if exited.
    bool try_reap();

    // Wait until the child exits, the deadline passes or *abort becomes true.
    // Returns true if the child exited.
    bool wait_until(std::chrono::steady_clock::time_point deadline,
                    const std::atomic<bool>* abort = nullptr);

    // SIGTERM, then SIGKILL after a short grace period, then reap.
    void stop();

    // Exit status of a reaped child; -1 when it was killed by a signal.
    int exit_code() const { return exit_code_; }

private:
    int pid_ = 0; // pid_t
    int exit_code_ = -1;
};

// on_path reports whether program is an executable file, either as given
// (when it contains a '/') or in one of the PATH directories.
bool on_path(const std::string& program);

} // namespace assetcat::thumbd
