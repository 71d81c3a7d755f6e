#include "cli/registry.hpp"

#include "shipit/errors.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

int ok_cmd(int, char **) { return 0; }
int usage_cmd(int, char **) { throw shipit::UsageError("no committable revision"); }
int abort_cmd(int, char **) { throw shipit::AbortError(); }
int svn_cmd(int, char **) { throw shipit::ExternalToolError("svn commit failed", 1); }
int empty_cmd(int, char **) {
  throw shipit::EmptyCommitError(std::vector<std::string>{"gone.txt"});
}

// Runs `name` with stderr captured.
int run(const std::string &name, std::string &err) {
  std::ostringstream buf;
  auto *old = std::cerr.rdbuf(buf.rdbuf());
  char arg0[] = "x";
  char *argv[] = {arg0, nullptr};
  const int rc = shipit::cli::run_command(name, 1, argv);
  std::cerr.rdbuf(old);
  err = buf.str();
  return rc;
}

void check(bool cond, const std::string &what) {
  if (!cond)
    throw std::runtime_error(what);
}

} // namespace

int main() {
  using namespace shipit::cli;
  register_command("ok", ok_cmd, "");
  register_command("usage", usage_cmd, "");
  register_command("abort", abort_cmd, "");
  register_command("svn", svn_cmd, "");
  register_command("empty", empty_cmd, "");

  try {
    std::string err;
    check(run("ok", err) == kExitOk && err.empty(), "ok command");

    check(run("usage", err) == kExitUsage, "usage error exits 2");
    check(err == "usage: no committable revision\n", "usage message prefixed: " + err);

    check(run("abort", err) == kExitFailure, "abort exits 1");
    check(err == "Aborted.\n", "abort prints only Aborted.: " + err);

    check(run("svn", err) == kExitFailure, "tool failure exits 1");
    check(err == "svn: svn commit failed\n", "tool failure message: " + err);

    check(run("empty", err) == kExitFailure, "empty commit exits 1");
    check(err.find("gone.txt") != std::string::npos, "empty commit names the path: " + err);

    check(run("nope", err) == kExitUsage, "unknown command exits 2");
    check(err.starts_with("unknown command: nope\n"), "unknown command message: " + err);
  } catch (const std::exception &e) {
    std::cerr << "cli dispatch: " << e.what() << "\n";
    return 1;
  }
  std::cout << "cli dispatch OK\n";
  return 0;
}
