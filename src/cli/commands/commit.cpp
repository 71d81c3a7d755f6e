#include "cli/context.hpp"

#include "shipit/errors.hpp"
#include "shipit/policy.hpp"
#include "shipit/util.hpp"
#include "shipit/vcs.hpp"
#include "shipit/workflow.hpp"

#include <iostream>
#include <string>

int cmd_commit(int argc, char **argv) {
  // shipit commit [--revision <id>] [--show]
  shipit::CommitOptions opts;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if ((a == "--revision" || a == "-r") && i + 1 < argc) {
      const auto id = shipit::parse_revision_id(argv[++i]);
      if (!id)
        throw shipit::UsageError(std::string("bad revision id '") + argv[i] + "'");
      opts.revision_id = id;
    } else if (a == "--show") {
      opts.show = true;
    } else {
      throw shipit::UsageError("usage: shipit commit [--revision <id>] [--show]");
    }
  }

  const auto wc = shipit::cli::require_working_copy();
  const auto user = shipit::load_user_config(shipit::user_config_path());
  opts.owner = user.user;

  auto review = shipit::cli::open_review(wc, user);
  shipit::SvnClient svn;
  shipit::ConfirmPolicy policy{shipit::console_confirm(std::cin, std::cout), std::cout};
  shipit::CommitWorkflow workflow{
      wc, *review, svn, policy, shipit::console_chooser(std::cin, std::cout), std::cout};
  return workflow.run(opts);
}
