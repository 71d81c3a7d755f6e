#include "cli/context.hpp"

#include "shipit/errors.hpp"
#include "shipit/util.hpp"

#include <iostream>
#include <string>

int cmd_mark_committed(int argc, char **argv) {
  if (argc != 2)
    throw shipit::UsageError("usage: shipit mark-committed <id>");
  const auto id = shipit::parse_revision_id(argv[1]);
  if (!id)
    throw shipit::UsageError(std::string("bad revision id '") + argv[1] + "'");

  const auto wc = shipit::cli::require_working_copy();
  const auto user = shipit::load_user_config(shipit::user_config_path());
  auto review = shipit::cli::open_review(wc, user);
  review->mark_committed(*id);
  std::cout << "Marked D" << *id << " committed.\n";
  return 0;
}
