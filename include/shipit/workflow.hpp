#pragma once
#include "shipit/policy.hpp"
#include "shipit/review.hpp"
#include "shipit/vcs.hpp"
#include "shipit/working_copy.hpp"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace shipit {

struct CommitOptions {
  std::optional<std::uint64_t> revision_id; // else ask among committable revisions
  std::string owner;                        // whose revisions count as committable
  bool show = false;                        // print the message only
};

// Picks one of a non-empty list of committable revisions.
using RevisionChooser = std::function<RevisionRef(const std::vector<RevisionRef> &)>;

// Lists revisions on `out` and reads a revision id from `in`. An empty
// answer selects the only revision when there is exactly one.
[[nodiscard]] RevisionChooser console_chooser(std::istream &in, std::ostream &out);

// Lands an accepted revision: pick it, reconcile its paths against the
// working copy, let `policy` rule on warnings, then commit.
class CommitWorkflow {
public:
  CommitWorkflow(const WorkingCopy &wc, ReviewService &review, Vcs &vcs, DecisionPolicy &policy,
                 RevisionChooser choose, std::ostream &out);

  int run(const CommitOptions &opts);

  [[nodiscard]] RevisionRef resolve_revision(const CommitOptions &opts);

  // Declared paths of `revision` that are safe to commit from this working
  // copy. Throws on conflicts, on an empty result, and on declined warnings.
  [[nodiscard]] std::set<std::string> commit_file_list(const RevisionRef &revision);

private:
  const WorkingCopy &wc_;
  ReviewService &review_;
  Vcs &vcs_;
  DecisionPolicy &policy_;
  RevisionChooser choose_;
  std::ostream &out_;
};

} // namespace shipit
