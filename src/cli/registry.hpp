#pragma once
#include <string>

#include "cli/command.hpp"

namespace shipit::cli {

// Exit codes shared by every subcommand.
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1; // aborts, conflicts, svn or network failures
inline constexpr int kExitUsage = 2;   // bad arguments, wrong revision, wrong backend

void register_command(const std::string &name, command_fn fn, const std::string &help);
command_fn find_command(const std::string &name);
void print_usage();

// Run a registered handler and turn whatever it throws into "<name>: <what>"
// on stderr plus the matching exit code. Unknown names print usage.
int run_command(const std::string &name, int argc, char **argv);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace shipit::cli
