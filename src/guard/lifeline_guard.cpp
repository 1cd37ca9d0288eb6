#include "lifeline_guard.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

const char* to_string(GuardOutcome outcome) {
    switch (outcome) {
        case GuardOutcome::Executed:         return "executed";
        case GuardOutcome::SkippedDuplicate: return "skipped-duplicate";
    }
    return "unknown";
}

static std::string dump_entries(const std::vector<ProcessEntry>& entries) {
    std::string out;
    for (const auto& e : entries) {
        out += fmt::format("\n{{pid: {}, command: \"{}\"}}", e.pid, e.command);
    }
    return out;
}

LifelineGuard::LifelineGuard(ProcessLister& lister) : lister_(lister) {}

GuardOutcome LifelineGuard::guard(const std::function<void()>& work) {
    return guard(platform::current_pid(), work);
}

GuardOutcome LifelineGuard::guard(int self_pid, const std::function<void()>& work) {
    if (!work) {
        throw UsageError("missing required block of work");
    }

    auto snapshot = lister_.list();
    if (!snapshot || snapshot->empty()) {
        lifeline_log("guard: no process data, aborting");
        throw EnvironmentError("No process data available from the process list. Aborting!");
    }
    const auto& processes = *snapshot;

    auto self = std::find_if(processes.begin(), processes.end(),
                             [&](const ProcessEntry& p) { return p.pid == self_pid; });
    if (self == processes.end()) {
        lifeline_log(fmt::format("guard: pid {} missing from {} entries", self_pid, processes.size()));
        throw EnvironmentError(fmt::format(
            "Unable to find self (PID={}) in process list. Exiting.{}",
            self_pid, dump_entries(processes)));
    }

    bool duplicate = std::any_of(processes.begin(), processes.end(),
                                 [&](const ProcessEntry& p) {
                                     return p.pid != self_pid && p.command == self->command;
                                 });
    if (duplicate) {
        lifeline_log(fmt::format("guard: '{}' already running, skipping", self->command));
        return GuardOutcome::SkippedDuplicate;
    }

    lifeline_log(fmt::format("guard: '{}' is unique, running work", self->command));
    work();
    return GuardOutcome::Executed;
}
