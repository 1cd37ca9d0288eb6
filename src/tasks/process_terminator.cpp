#include "process_terminator.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <signal.h>

std::string SignalProcessKiller::kill_process(int pid) {
    return platform::send_signal(pid, SIGKILL);
}

// `token` must appear as a whole whitespace-separated argument, so that
// "N:lifeline" does not also hit "XN:lifeline" or "foo:N:lifeline".
static bool contains_token(const std::string& command, const std::string& token) {
    auto is_sep = [](char c) { return c == ' ' || c == '\t'; };
    for (size_t pos = command.find(token); pos != std::string::npos;
         pos = command.find(token, pos + 1)) {
        size_t end = pos + token.size();
        bool starts = pos == 0 || is_sep(command[pos - 1]);
        bool ends = end == command.size() || is_sep(command[end]);
        if (starts && ends) return true;
    }
    return false;
}

ProcessTerminator::ProcessTerminator(ProcessLister& lister, ProcessKiller& killer,
                                     std::string marker)
    : ProcessTerminator(lister, killer, std::move(marker), platform::current_pid()) {}

ProcessTerminator::ProcessTerminator(ProcessLister& lister, ProcessKiller& killer,
                                     std::string marker, int self_pid)
    : lister_(lister), killer_(killer), marker_(std::move(marker)), self_pid_(self_pid) {}

bool ProcessTerminator::matches(const std::string& command, const std::string& label) const {
    if (label.empty() || !contains_token(command, label)) return false;

    // The marker is checked against the program name only, since the label
    // itself usually contains the word "lifeline".
    std::string program = command.substr(0, command.find_first_of(" \t"));
    auto slash = program.rfind('/');
    if (slash != std::string::npos) program.erase(0, slash + 1);
    return program.find(marker_) != std::string::npos;
}

TerminationReport ProcessTerminator::terminate(const std::string& label) {
    TerminationReport report;

    auto snapshot = lister_.list();
    if (!snapshot) {
        report.error = "No process data available; nothing terminated";
        lifeline_log(fmt::format("terminate: {} ({})", report.error, label));
        return report;
    }

    for (const auto& p : *snapshot) {
        if (p.pid == self_pid_ || !matches(p.command, label)) continue;

        std::string err = killer_.kill_process(p.pid);
        if (err.empty()) {
            report.killed.push_back(p.pid);
            report.lines.push_back(fmt::format("Killed {} ({})", p.pid, p.command));
        } else {
            report.lines.push_back(fmt::format("Failed to kill {} ({}): {}", p.pid, p.command, err));
        }
        lifeline_log(fmt::format("terminate: {}", report.lines.back()));
    }

    if (report.lines.empty()) {
        lifeline_log(fmt::format("terminate: no running {} processes", label));
    }
    return report;
}
