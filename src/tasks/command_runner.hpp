#pragma once

#include <core/types.hpp>

// Run `ns.command` through /bin/sh in `ns.directory`, inheriting stdio, and
// wait for it. Throws std::runtime_error if it cannot be started or exits
// non-zero.
void run_namespace_command(const NamespaceConfig& ns);
