#pragma once

#include <string>
#include <vector>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Block until the process exits. Returns its exit code, 128 + signal
    // if it was killed, or -1 if there is nothing to wait for.
    int wait();

private:
    int pid_ = -1;
    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& working_dir);
};

// Spawn a child process with inherited stdio.
// working_dir: if non-empty, the child chdirs there before exec.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& working_dir = "");

// Send `signal` to `pid`. Returns an empty string on success, otherwise the
// strerror text.
std::string send_signal(int pid, int signal);

} // namespace platform
