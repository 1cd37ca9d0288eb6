#include "lifeline_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <tasks/command_runner.hpp>
#include <tasks/task_binder.hpp>
#include <algorithm>
#include <fmt/format.h>

LifelineCLI::LifelineCLI(Config config, std::ostream& out)
    : LifelineCLI(std::move(config), std::make_unique<PsProcessLister>(),
                  std::make_unique<SignalProcessKiller>(), out) {}

LifelineCLI::LifelineCLI(Config config, std::unique_ptr<ProcessLister> lister,
                         std::unique_ptr<ProcessKiller> killer, std::ostream& out)
    : config_(std::move(config)),
      owned_lister_(std::move(lister)),
      owned_killer_(std::move(killer)),
      lister_(*owned_lister_),
      killer_(*owned_killer_),
      out_(out),
      guard_(lister_),
      terminator_(lister_, killer_, config_.marker()) {
    if (!config_.log_file().empty()) {
        set_lifeline_log_path(config_.log_file());
    }
    bind_namespaces();
}

LifelineCLI::LifelineCLI(Config config, ProcessLister& lister, ProcessKiller& killer,
                         std::ostream& out)
    : config_(std::move(config)),
      lister_(lister),
      killer_(killer),
      out_(out),
      guard_(lister_),
      terminator_(lister_, killer_, config_.marker()) {
    if (!config_.log_file().empty()) {
        set_lifeline_log_path(config_.log_file());
    }
    bind_namespaces();
}

void LifelineCLI::bind_namespaces() {
    for (const auto& ns : config_.namespaces()) {
        LifelineTaskOptions options;
        options.prereqs = ns.prereqs;
        bind_lifeline_tasks(registry_, ns.name, options,
                            [ns]() { run_namespace_command(ns); },
                            guard_, terminator_,
                            [this](const std::string& line) { out_ << theme::info(line); });
    }
}

void LifelineCLI::print_tasks() const {
    size_t width = 0;
    for (const auto& name : registry_.names()) {
        width = std::max(width, name.size());
    }

    std::string title = config_.path().empty()
        ? std::string("Tasks")
        : fmt::format("Tasks in {}", config_.path().string());
    out_ << theme::section(title);
    for (const auto& name : registry_.names()) {
        std::string desc = registry_.description(name);
        // Show the user's own description next to the run task
        auto colon = name.rfind(':');
        if (colon != std::string::npos && name.compare(colon, std::string::npos, RUN_TASK_SUFFIX) == 0) {
            const NamespaceConfig* ns = config_.find_namespace(name.substr(0, colon));
            if (ns && !ns->description.empty()) desc = ns->description;
        }
        out_ << theme::task_row(name, desc, width);
    }
    out_ << "\n";
}

int LifelineCLI::run_tasks(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        try {
            registry_.invoke(name);
        } catch (const std::exception& e) {
            lifeline_log(fmt::format("{} failed: {}", name, e.what()));
            out_ << theme::fail(std::string(e.what()));
            return 1;
        }
    }
    return 0;
}
