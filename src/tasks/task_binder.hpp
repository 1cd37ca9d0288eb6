#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <guard/lifeline_guard.hpp>
#include <tasks/task_registry.hpp>
#include <tasks/process_terminator.hpp>

struct LifelineTaskOptions {
    std::vector<std::string> prereqs;   // prerequisites of <ns>:run
};

// Names of the three tasks defined for one namespace.
struct LifelineTasks {
    std::string run;
    std::string lifeline;
    std::string terminate;
};

LifelineTasks lifeline_task_names(const std::string& ns);

// Defines in `registry`:
//   <ns>:run        runs `body`, after `options.prereqs`
//   <ns>:lifeline   invokes <ns>:run through `guard`, so only one runs at a time
//   <ns>:terminate  kills running <ns>:lifeline processes via `terminator`
//
// Prefix the namespace with something project specific: two projects that
// both define "cron:lifeline" look like the same process to the guard.
//
// Throws UsageError if `body` is empty or `ns` is blank, before anything is
// registered. `status` receives the terminate task's report lines.
LifelineTasks bind_lifeline_tasks(TaskRegistry& registry,
                                  const std::string& ns,
                                  const LifelineTaskOptions& options,
                                  TaskRegistry::TaskBody body,
                                  LifelineGuard& guard,
                                  ProcessTerminator& terminator,
                                  StatusCallback status = nullptr);
