#include "platform.hpp"
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path temp_dir() {
    return fs::temp_directory_path();
}

int current_pid() {
    return static_cast<int>(getpid());
}

} // namespace platform
