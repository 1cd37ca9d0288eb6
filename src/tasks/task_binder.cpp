#include "task_binder.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

LifelineTasks lifeline_task_names(const std::string& ns) {
    return {ns + RUN_TASK_SUFFIX, ns + LIFELINE_TASK_SUFFIX, ns + TERMINATE_TASK_SUFFIX};
}

LifelineTasks bind_lifeline_tasks(TaskRegistry& registry,
                                  const std::string& ns,
                                  const LifelineTaskOptions& options,
                                  TaskRegistry::TaskBody body,
                                  LifelineGuard& guard,
                                  ProcessTerminator& terminator,
                                  StatusCallback status) {
    if (!body) {
        throw UsageError("You must pass in a body for the run task");
    }
    if (ns.empty() || ns.find_first_of(" \t\r\n") != std::string::npos) {
        throw UsageError(fmt::format("invalid task namespace '{}'", ns));
    }

    LifelineTasks names = lifeline_task_names(ns);

    registry.define(names.run,
                    fmt::format("Runs the {} task", names.run),
                    options.prereqs,
                    std::move(body));

    registry.define(names.lifeline,
                    fmt::format("A lifeline task for executing only one process of {} at a time", names.run),
                    {},
                    [&registry, &guard, run = names.run]() {
                        GuardOutcome outcome = guard.guard([&registry, &run]() {
                            registry.invoke(run);
                        });
                        lifeline_log(fmt::format("{}: {}", run, to_string(outcome)));
                    });

    registry.define(names.terminate,
                    fmt::format("Terminates any running {} tasks", names.lifeline),
                    {},
                    [&terminator, status, label = names.lifeline]() {
                        TerminationReport report = terminator.terminate(label);
                        if (!status) return;
                        if (!report.ok()) status(report.error);
                        for (const auto& line : report.lines) status(line);
                    });

    return names;
}
