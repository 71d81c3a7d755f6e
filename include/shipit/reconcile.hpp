#pragma once
#include "shipit/oracle.hpp"
#include "shipit/status.hpp"

#include <set>
#include <string>
#include <vector>

namespace shipit {

// Paths the review service says belong to a revision.
using DeclaredPathSet = std::set<std::string>;

struct ReconciliationResult {
  std::set<std::string> final_paths;                 // what to hand to the VCS
  std::vector<std::string> unincluded_modifications; // changed locally, not in the revision
  std::vector<std::string> missing_paths;            // declared, gone from disk, not deleted
  std::vector<std::string> conflicts;                // always empty on return
};

/**
 * Decide which declared paths can be committed.
 *
 * Throws ConflictError when a declared directory contains a locally changed
 * path the revision leaves out: the VCS would commit that path along with
 * the directory. Throws EmptyCommitError when no declared path survives.
 * Never prompts and never touches the working copy beyond `oracle`.
 */
[[nodiscard]] ReconciliationResult reconcile(const DeclaredPathSet &declared,
                                             const WorkingCopyStatus &status,
                                             const ExistenceOracle &oracle);

} // namespace shipit
