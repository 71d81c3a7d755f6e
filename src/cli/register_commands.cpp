#include "cli/registry.hpp"

int cmd_commit(int argc, char **argv);
int cmd_mark_committed(int argc, char **argv);
int cmd_status(int, char **);

namespace shipit::cli {

void register_all_commands() {
  register_command("commit", ::cmd_commit,
                   "Commit an accepted revision: shipit commit [--revision <id>] [--show]");
  register_command("mark-committed", ::cmd_mark_committed,
                   "Mark a revision committed: shipit mark-committed <id>");
  register_command("status", ::cmd_status, "Show working copy changes as shipit sees them");
}

} // namespace shipit::cli
