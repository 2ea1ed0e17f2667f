#include "assetcat/thumbd_process.h"

#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace assetcat::thumbd {

static constexpr auto poll_step = std::chrono::milliseconds(10);
static constexpr auto kill_grace = std::chrono::milliseconds(500);

ChildProcess::~ChildProcess() {
    stop();
}

bool ChildProcess::launch(const std::string& program, const std::vector<std::string>& args) {
    stop(); // Clean up any previous child
    exit_code_ = -1;

    // Built before fork: the child may only call async-signal-safe functions.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args)
        argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == 0) {
        int null_fd = open("/dev/null", O_RDWR);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            dup2(null_fd, STDOUT_FILENO);
            dup2(null_fd, STDERR_FILENO);
            if (null_fd > STDERR_FILENO) close(null_fd);
        }
        // Own process group, so stop() also reaches grandchildren (xvfb-run).
        setpgid(0, 0);
        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);
    } else if (pid > 0) {
        pid_ = pid;
        return true;
    }
    return false;
}

bool ChildProcess::running() const {
    return pid_ > 0;
}

bool ChildProcess::try_reap() {
    if (pid_ <= 0) return true;
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r > 0) {
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        pid_ = 0;
        return true;
    }
    if (r < 0) {
        pid_ = 0;
        return true;
    }
    return false;
}

bool ChildProcess::wait_until(std::chrono::steady_clock::time_point deadline,
                              const std::atomic<bool>* abort) {
    for (;;) {
        if (try_reap()) return true;
        if (abort && abort->load()) return false;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(poll_step);
    }
}

void ChildProcess::stop() {
    if (pid_ <= 0) return;
    kill(-pid_, SIGTERM);
    kill(pid_, SIGTERM);
    if (wait_until(std::chrono::steady_clock::now() + kill_grace)) return;
    kill(-pid_, SIGKILL);
    kill(pid_, SIGKILL);
    int status = 0;
    waitpid(pid_, &status, 0);
    pid_ = 0;
    exit_code_ = -1;
}

bool on_path(const std::string& program) {
    if (program.empty()) return false;
    if (program.find('/') != std::string::npos)
        return access(program.c_str(), X_OK) == 0;

    const char* path = std::getenv("PATH");
    if (!path) return false;
    std::string dirs(path);
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = end > start ? dirs.substr(start, end - start) : ".";
        std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) return true;
        start = end + 1;
    }
    return false;
}

} // namespace assetcat::thumbd
