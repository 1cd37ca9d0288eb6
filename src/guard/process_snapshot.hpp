#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>

// Parse `ps ax -o pid,command` style output.
// Each line must look like "<optional whitespace><digits><one whitespace><command>".
// Commands are trimmed; lines that don't match (the header, blanks, garbage)
// are dropped.
std::vector<ProcessEntry> parse_process_list(const std::string& text);

// Source of process table snapshots. Production code shells out to ps; tests
// hand back canned tables.
class ProcessLister {
public:
    virtual ~ProcessLister() = default;

    // Current process table, or nullopt if the listing facility is unavailable.
    // Never throws for an unavailable facility.
    virtual ProcessSnapshot list() = 0;
};

class PsProcessLister : public ProcessLister {
public:
    explicit PsProcessLister(std::string command = PS_LIST_CMD);

    ProcessSnapshot list() override;

private:
    std::string command_;
};
