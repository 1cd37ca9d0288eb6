#include "command_runner.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <stdexcept>

void run_namespace_command(const NamespaceConfig& ns) {
    lifeline_log(fmt::format("{}{}: starting '{}'", ns.name, RUN_TASK_SUFFIX, ns.command));

    auto handle = platform::spawn(SHELL_PATH, {"-c", ns.command}, ns.directory);
    if (!handle.valid()) {
        throw std::runtime_error(fmt::format("{}{}: failed to start '{}'",
                                             ns.name, RUN_TASK_SUFFIX, ns.command));
    }

    int code = handle.wait();
    lifeline_log(fmt::format("{}{}: exited with {}", ns.name, RUN_TASK_SUFFIX, code));
    if (code == EXIT_SPAWN_FAILED && !ns.directory.empty()) {
        throw std::runtime_error(fmt::format("{}{} command exited with status {} (is '{}' a directory?)",
                                             ns.name, RUN_TASK_SUFFIX, code, ns.directory));
    }
    if (code != 0) {
        throw std::runtime_error(fmt::format("{}{} command exited with status {}",
                                             ns.name, RUN_TASK_SUFFIX, code));
    }
}
