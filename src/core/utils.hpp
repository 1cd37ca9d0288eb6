#pragma once

#include <string>
#include <optional>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Run a shell command and capture its stdout.
// Returns nullopt if the command could not be started.
std::optional<std::string> run_capture(const std::string& cmd);
