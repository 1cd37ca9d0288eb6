#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>

// Named, described units of work with prerequisites, invoked by name.
//
// invoke() follows make/rake semantics: prerequisites run first, in the order
// they were declared, and every task runs at most once per registry until it
// is reenabled. A task whose body throws is not marked as done.
class TaskRegistry {
public:
    using TaskBody = std::function<void()>;

    struct Task {
        std::string name;
        std::string description;
        std::vector<std::string> prereqs;
        TaskBody body;
        bool invoked = false;
    };

    // Throws UsageError on an empty name, empty body, or a name that is
    // already defined.
    void define(const std::string& name,
                const std::string& description,
                const std::vector<std::string>& prereqs,
                TaskBody body);

    // Run prerequisites then the task. Throws UsageError for unknown tasks
    // and prerequisite cycles.
    void invoke(const std::string& name);

    // Run the body only, regardless of prerequisites or previous invocation.
    void execute(const std::string& name);

    // Allow an invoked task to run again.
    void reenable(const std::string& name);

    bool contains(const std::string& name) const;
    const Task* lookup(const std::string& name) const;
    std::string description(const std::string& name) const;

    // Task names in definition order.
    const std::vector<std::string>& names() const { return order_; }

private:
    Task& get(const std::string& name);
    void invoke_chain(const std::string& name, std::vector<std::string>& chain);

    std::map<std::string, Task> tasks_;
    std::vector<std::string> order_;
};
