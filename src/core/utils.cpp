#include "utils.hpp"
#include <cstdio>
#include <array>
#include <stdexcept>
#include <sys/wait.h>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

std::optional<std::string> run_capture(const std::string& cmd) {
    std::array<char, 512> buffer;
    std::string result;

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        return std::nullopt;
    }

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result += buffer.data();
    }

    // popen succeeds even when /bin/sh can't find the command; the shell
    // then exits 127 with nothing on stdout.
    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 127 && result.empty()) {
        return std::nullopt;
    }
    return result;
}
