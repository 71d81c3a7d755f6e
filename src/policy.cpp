#include "shipit/policy.hpp"

#include "shipit/errors.hpp"
#include "shipit/util.hpp"

#include <spdlog/spdlog.h>

#include <istream>
#include <ostream>
#include <utility>

namespace shipit {

ConfirmPolicy::ConfirmPolicy(ConfirmFn confirm, std::ostream &out)
    : confirm_(std::move(confirm)), out_{out} {}

WarningText warning_text(Advisory category, const std::vector<std::string> &paths) {
  const bool one = paths.size() == 1;
  switch (category) {
  case Advisory::ForeignWorkingCopy:
    // paths = {revision source, current root}
    if (paths.size() == 2)
      return {.prefix = "Revision was generated from '" + paths[0] +
                        "', but the current working copy root is '" + paths[1] + "'.",
              .prompt = "Commit anyway?",
              .list_paths = false};
    return {.prefix = "Revision was generated from a different working copy:",
            .prompt = "Commit anyway?"};
  case Advisory::UnincludedModifications:
    if (one)
      return {.prefix = "A locally modified path is not included in this revision:",
              .prompt = "It will NOT be committed. Commit this revision anyway?"};
    return {.prefix = "Locally modified paths are not included in this revision:",
            .prompt = "They will NOT be committed. Commit this revision anyway?"};
  case Advisory::MissingPaths:
    if (one)
      return {.prefix = "Revision includes changes to a path that does not exist:",
              .prompt = "Commit this revision anyway?"};
    return {.prefix = "Revision includes changes to paths that do not exist:",
            .prompt = "Commit this revision anyway?"};
  }
  return {};
}

Decision ConfirmPolicy::decide(Advisory category, const std::vector<std::string> &paths) {
  const auto text = warning_text(category, paths);
  out_ << text.prefix << "\n\n";
  if (text.list_paths) {
    for (const auto &p : paths) {
      out_ << "    " << p << "\n";
    }
    out_ << "\n";
  }
  return confirm_(text.prompt) ? Decision::Proceed : Decision::Abort;
}

void require_proceed(DecisionPolicy &policy, Advisory category,
                     const std::vector<std::string> &paths) {
  if (paths.empty())
    return;
  if (policy.decide(category, paths) == Decision::Abort) {
    spdlog::debug("[policy] operator declined ({} path(s))", paths.size());
    throw AbortError();
  }
}

ConfirmFn console_confirm(std::istream &in, std::ostream &out) {
  return [&in, &out](std::string_view prompt) {
    out << prompt << " [y/N] " << std::flush;
    std::string line;
    if (!std::getline(in, line))
      return false;
    const std::string answer = strutil::trim(line);
    return answer == "y" || answer == "Y" || answer == "yes" || answer == "Yes";
  };
}

} // namespace shipit
