#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret != pid_) return -1;
    pid_ = -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& working_dir) {
    ProcessHandle handle;

    // Build argv before fork so the child only calls async-signal-safe functions
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    return handle;
}

std::string send_signal(int pid, int signal) {
    if (kill(static_cast<pid_t>(pid), signal) == 0) return "";
    return std::strerror(errno);
}

} // namespace platform
