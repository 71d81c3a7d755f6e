#include "cli/context.hpp"

#include "shipit/errors.hpp"
#include "shipit/status.hpp"
#include "shipit/vcs.hpp"

#include <iostream>

int cmd_status(int /*argc*/, char ** /*argv*/) {
  const auto wc = shipit::cli::require_working_copy();
  if (wc.backend() != shipit::Backend::Subversion)
    throw shipit::UsageError(wc.root().string() + " is not a Subversion working copy");

  shipit::SvnClient svn;
  const auto st = svn.status(wc.root());

  std::cout << "Working copy " << wc.root().string() << "\n\n";
  if (st.empty()) {
    std::cout << "  (no changes)\n";
    return 0;
  }
  for (const auto &[path, mask] : st) {
    std::cout << "  " << shipit::describe_flags(mask) << "\t" << path << "\n";
  }
  return 0;
}
