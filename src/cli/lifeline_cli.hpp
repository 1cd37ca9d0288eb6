#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <guard/lifeline_guard.hpp>
#include <guard/process_snapshot.hpp>
#include <tasks/process_terminator.hpp>
#include <tasks/task_registry.hpp>

// Wires a loaded lifeline.yaml into a task registry: every namespace gets
// its run/lifeline/terminate tasks.
class LifelineCLI {
public:
    // Production wiring: ps for listings, SIGKILL for terminate.
    explicit LifelineCLI(Config config, std::ostream& out = std::cout);

    // Caller-supplied process table and killer; both must outlive the CLI.
    LifelineCLI(Config config, ProcessLister& lister, ProcessKiller& killer,
                std::ostream& out = std::cout);

    LifelineCLI(const LifelineCLI&) = delete;
    LifelineCLI& operator=(const LifelineCLI&) = delete;

    // `lifeline --tasks`
    void print_tasks() const;

    // Invoke each task in order. Returns the process exit code: 0 when every
    // task finished (a skipped duplicate included), 1 at the first failure.
    int run_tasks(const std::vector<std::string>& names);

    const TaskRegistry& registry() const { return registry_; }

private:
    LifelineCLI(Config config, std::unique_ptr<ProcessLister> lister,
                std::unique_ptr<ProcessKiller> killer, std::ostream& out);

    void bind_namespaces();

    Config config_;
    std::unique_ptr<ProcessLister> owned_lister_;
    std::unique_ptr<ProcessKiller> owned_killer_;
    ProcessLister& lister_;
    ProcessKiller& killer_;
    std::ostream& out_;
    LifelineGuard guard_;
    ProcessTerminator terminator_;
    TaskRegistry registry_;
};
