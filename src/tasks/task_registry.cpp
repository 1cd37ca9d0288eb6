#include "task_registry.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

void TaskRegistry::define(const std::string& name,
                          const std::string& description,
                          const std::vector<std::string>& prereqs,
                          TaskBody body) {
    if (name.empty()) {
        throw UsageError("task name must not be empty");
    }
    if (!body) {
        throw UsageError(fmt::format("task '{}' needs a body", name));
    }
    if (tasks_.count(name)) {
        throw UsageError(fmt::format("task '{}' is already defined", name));
    }

    tasks_[name] = Task{name, description, prereqs, std::move(body), false};
    order_.push_back(name);
}

TaskRegistry::Task& TaskRegistry::get(const std::string& name) {
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        throw UsageError(fmt::format("Don't know how to build task '{}'", name));
    }
    return it->second;
}

void TaskRegistry::invoke(const std::string& name) {
    std::vector<std::string> chain;
    invoke_chain(name, chain);
}

void TaskRegistry::invoke_chain(const std::string& name, std::vector<std::string>& chain) {
    Task& task = get(name);

    if (std::find(chain.begin(), chain.end(), name) != chain.end()) {
        std::string path;
        for (const auto& n : chain) path += n + " => ";
        throw UsageError(fmt::format("Circular dependency detected: {}{}", path, name));
    }
    if (task.invoked) return;

    task.invoked = true;
    chain.push_back(name);
    try {
        for (const auto& prereq : task.prereqs) {
            invoke_chain(prereq, chain);
        }
        lifeline_log(fmt::format("task: invoke {}", name));
        task.body();
    } catch (...) {
        task.invoked = false;
        throw;
    }
    chain.pop_back();
}

void TaskRegistry::execute(const std::string& name) {
    Task& task = get(name);
    lifeline_log(fmt::format("task: execute {}", name));
    task.body();
}

void TaskRegistry::reenable(const std::string& name) {
    get(name).invoked = false;
}

bool TaskRegistry::contains(const std::string& name) const {
    return tasks_.count(name) > 0;
}

const TaskRegistry::Task* TaskRegistry::lookup(const std::string& name) const {
    auto it = tasks_.find(name);
    return it == tasks_.end() ? nullptr : &it->second;
}

std::string TaskRegistry::description(const std::string& name) const {
    const Task* task = lookup(name);
    return task ? task->description : "";
}
