#include "shipit/reconcile.hpp"

#include "shipit/errors.hpp"
#include "shipit/util.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace shipit {

namespace {

// Declared set keyed by normalized path, so "dir/" and "dir" agree.
std::set<std::string> normalized(const DeclaredPathSet &declared) {
  std::set<std::string> out;
  for (const auto &p : declared)
    out.insert(pathutil::normalize(p));
  return out;
}

} // namespace

ReconciliationResult reconcile(const DeclaredPathSet &declared, const WorkingCopyStatus &status,
                               const ExistenceOracle &oracle) {
  const auto members = normalized(declared);
  ReconciliationResult result;

  // 1) + 2): every locally changed path outside the revision is either a
  // conflict (some declared directory contains it) or an advisory.
  for (const auto &[path, mask] : status) {
    (void)mask;
    const std::string p = pathutil::normalize(path);
    if (members.contains(p))
      continue;
    for (const auto &d : declared) {
      if (pathutil::is_descendant(p, d)) {
        spdlog::debug("[reconcile] conflict: '{}' contains excluded '{}'", d, path);
        throw ConflictError(d, path);
      }
    }
    result.unincluded_modifications.push_back(path);
  }

  // 3) drop declared paths that vanished without a staged deletion
  for (const auto &p : declared) {
    const std::string key = pathutil::normalize(p);
    if (oracle.exists(key) || oracle.is_symlink(key)) {
      result.final_paths.insert(p);
      continue;
    }
    StatusMask mask = flags_for(status, p);
    if (key != p)
      mask |= flags_for(status, key);
    if (has_flag(mask, kFlagDeleted)) {
      result.final_paths.insert(p);
      continue;
    }
    result.missing_paths.push_back(p);
  }

  spdlog::debug("[reconcile] declared={} kept={} unincluded={} missing={}", declared.size(),
                result.final_paths.size(), result.unincluded_modifications.size(),
                result.missing_paths.size());

  // 4)
  if (result.final_paths.empty())
    throw EmptyCommitError(std::move(result.missing_paths));
  return result;
}

} // namespace shipit
