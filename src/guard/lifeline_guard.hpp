#pragma once

#include <functional>
#include <guard/process_snapshot.hpp>

enum class GuardOutcome {
    Executed,          // no other instance; work ran
    SkippedDuplicate,  // another pid has our exact command line; work not run
};

const char* to_string(GuardOutcome outcome);

// Runs a unit of work only if no other process shares the caller's command
// line. Uniqueness comes from the live process table, so there is no lock or
// pid file to clean up. It is best effort: two processes started close
// together can both see themselves as unique.
//
// Command lines are compared whole, arguments included.
class LifelineGuard {
public:
    explicit LifelineGuard(ProcessLister& lister);

    // Throws UsageError if `work` is empty (checked before touching the
    // process table), EnvironmentError if the table is unavailable or empty
    // or doesn't contain `self_pid`. Exceptions thrown by `work` propagate
    // untouched.
    GuardOutcome guard(int self_pid, const std::function<void()>& work);

    // Same, for the calling process.
    GuardOutcome guard(const std::function<void()>& work);

private:
    ProcessLister& lister_;
};
