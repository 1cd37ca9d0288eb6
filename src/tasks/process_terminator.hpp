#pragma once

#include <string>
#include <vector>
#include <core/constants.hpp>
#include <guard/process_snapshot.hpp>

// Sends the forceful termination signal.
class ProcessKiller {
public:
    virtual ~ProcessKiller() = default;

    // Returns an empty string on success, otherwise a reason.
    virtual std::string kill_process(int pid) = 0;
};

// SIGKILL via kill(2).
class SignalProcessKiller : public ProcessKiller {
public:
    std::string kill_process(int pid) override;
};

struct TerminationReport {
    std::vector<int> killed;
    std::vector<std::string> lines;   // one per candidate, for the operator
    std::string error;                // set when no listing was available

    bool ok() const { return error.empty(); }
};

// Kills every process whose command line has `label` as one of its
// arguments and whose program name contains the runtime marker. The caller's own pid is never a
// candidate.
class ProcessTerminator {
public:
    ProcessTerminator(ProcessLister& lister, ProcessKiller& killer,
                      std::string marker = DEFAULT_RUNTIME_MARKER);
    ProcessTerminator(ProcessLister& lister, ProcessKiller& killer,
                      std::string marker, int self_pid);

    TerminationReport terminate(const std::string& label);

    // True if `command` looks like a lifeline runtime carrying `label`.
    bool matches(const std::string& command, const std::string& label) const;

    const std::string& marker() const { return marker_; }

private:
    ProcessLister& lister_;
    ProcessKiller& killer_;
    std::string marker_;
    int self_pid_;
};
