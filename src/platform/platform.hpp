#pragma once

#include <filesystem>

namespace platform {

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Pid of the calling process.
int current_pid();

} // namespace platform
