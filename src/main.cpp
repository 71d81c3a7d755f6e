#include "cli/registry.hpp"

#include "shipit/log.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  shipit::cli::register_all_commands(); // defined in register_commands.cpp

  int first = 1;
  bool verbose = false;
  while (first < argc) {
    const std::string a = argv[first];
    if (a != "-v" && a != "--verbose")
      break;
    verbose = true;
    ++first;
  }
  shipit::init_logging(verbose);

  if (first >= argc) {
    shipit::cli::print_usage();
    return shipit::cli::kExitUsage;
  }
  const std::string cmd = argv[first];
  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    shipit::cli::print_usage();
    return shipit::cli::kExitOk;
  }

  // Pass everything after the subcommand to the handler
  return shipit::cli::run_command(cmd, argc - first, argv + first);
}
