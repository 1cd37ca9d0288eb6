#pragma once

// ── Process listing ─────────────────────────────────────────
// One process per line: "<pid> <full command line>".
constexpr const char* PS_LIST_CMD = "ps ax -o pid,command";

// ── Termination ─────────────────────────────────────────────
// Substring every lifeline-run process carries in its command line.
constexpr const char* DEFAULT_RUNTIME_MARKER = "lifeline";

// ── Task name suffixes ──────────────────────────────────────
constexpr const char* RUN_TASK_SUFFIX       = ":run";
constexpr const char* LIFELINE_TASK_SUFFIX  = ":lifeline";
constexpr const char* TERMINATE_TASK_SUFFIX = ":terminate";

// ── Files ───────────────────────────────────────────────────
constexpr const char* PROJECT_CONFIG_FILE = "lifeline.yaml";
constexpr const char* DEBUG_LOG_FILE      = "lifeline_debug.log";

// ── Command runner ──────────────────────────────────────────
constexpr const char* SHELL_PATH = "/bin/sh";
constexpr int EXIT_SPAWN_FAILED  = 127;   // execvp failed in the child

constexpr const char* LIFELINE_VERSION = "0.1.0";
