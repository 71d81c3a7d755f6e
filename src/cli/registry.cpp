#include "cli/registry.hpp"

#include "shipit/errors.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <map>

namespace shipit::cli {

namespace {

struct entry {
  command_fn fn;
  std::string help;
};

std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

} // namespace

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage() {
  std::cerr << "usage: shipit [-v] <command> [args]\n\n";
  std::cerr << "commands:\n";
  for (const auto &[name, e] : table()) {
    std::cerr << "  " << name << "  " << e.help << "\n";
  }
}

int run_command(const std::string &name, int argc, char **argv) {
  const auto fn = find_command(name);
  if (!fn) {
    std::cerr << "unknown command: " << name << "\n";
    print_usage();
    return kExitUsage;
  }

  try {
    return fn(argc, argv);
  } catch (const AbortError &e) {
    // operator said no; nothing was changed, so no command prefix
    std::cerr << e.what() << "\n";
    return kExitFailure;
  } catch (const UsageError &e) {
    std::cerr << name << ": " << e.what() << "\n";
    return kExitUsage;
  } catch (const ExternalToolError &e) {
    spdlog::debug("[cli] {} failed, external exit code {}", name, e.exit_code());
    std::cerr << name << ": " << e.what() << "\n";
    return kExitFailure;
  } catch (const std::exception &e) {
    std::cerr << name << ": " << e.what() << "\n";
    return kExitFailure;
  }
}

} // namespace shipit::cli
