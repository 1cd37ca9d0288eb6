#include "process_snapshot.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <cstring>
#include <sstream>

// Separators and padding that may surround a ps field.
static const char* const WHITESPACE = " \t\r\n\v\f";

static bool is_space(char c) {
    return c != '\0' && std::strchr(WHITESPACE, c) != nullptr;
}

// Scanned by hand: a regex over the whole line recurses per character and
// overflows the stack on the 30k+ character command lines Java processes
// carry.
static bool parse_process_line(const std::string& line, ProcessEntry& out) {
    size_t pos = line.find_first_not_of(WHITESPACE);
    if (pos == std::string::npos) return false;

    size_t digits_end = line.find_first_not_of("0123456789", pos);
    if (digits_end == pos || digits_end == std::string::npos) return false;
    if (!is_space(line[digits_end])) return false;

    size_t cmd_start = line.find_first_not_of(WHITESPACE, digits_end + 1);
    if (cmd_start == std::string::npos) return false;
    size_t cmd_end = line.find_last_not_of(WHITESPACE);

    int pid = safe_stoi(line.substr(pos, digits_end - pos), -1);
    if (pid <= 0) return false;  // overflowed or zero

    out.pid = pid;
    out.command = line.substr(cmd_start, cmd_end - cmd_start + 1);
    return true;
}

std::vector<ProcessEntry> parse_process_list(const std::string& text) {
    std::vector<ProcessEntry> entries;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        ProcessEntry entry;
        if (parse_process_line(line, entry)) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

// ── PsProcessLister ─────────────────────────────────────────

PsProcessLister::PsProcessLister(std::string command)
    : command_(std::move(command)) {}

ProcessSnapshot PsProcessLister::list() {
    auto output = run_capture(command_);
    if (!output) {
        lifeline_log(fmt::format("snapshot: '{}' could not be run", command_));
        return std::nullopt;
    }
    auto entries = parse_process_list(*output);
    lifeline_log(fmt::format("snapshot: {} processes from '{}'", entries.size(), command_));
    return entries;
}
