#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// One row of the process table at snapshot time.
struct ProcessEntry {
    int pid = 0;
    std::string command;

    bool operator==(const ProcessEntry& other) const {
        return pid == other.pid && command == other.command;
    }
};

// Absent when the listing facility could not be run at all.
using ProcessSnapshot = std::optional<std::vector<ProcessEntry>>;

// One namespace block from lifeline.yaml
struct NamespaceConfig {
    std::string name;
    std::string description;
    std::string command;                       // shell command run by <name>:run
    std::vector<std::string> prereqs;          // tasks invoked before <name>:run
    std::string directory;                     // working directory, empty = inherit
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
