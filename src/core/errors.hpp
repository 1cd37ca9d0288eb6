#pragma once

#include <stdexcept>
#include <string>

// Caller misuse: missing work body, unknown or malformed task names.
class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& msg) : std::invalid_argument(msg) {}
};

// The host could not tell us what we need (no process data, self missing).
class EnvironmentError : public std::runtime_error {
public:
    explicit EnvironmentError(const std::string& msg) : std::runtime_error(msg) {}
};
