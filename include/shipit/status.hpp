#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace shipit {

// Change flags for one working-copy path. Several may be set at once.
enum StatusFlag : std::uint32_t {
  kFlagModified    = 1U << 0,
  kFlagAdded       = 1U << 1,
  kFlagDeleted     = 1U << 2,
  kFlagUnversioned = 1U << 3,
  kFlagConflicted  = 1U << 4,
  kFlagMissing     = 1U << 5,
  kFlagExternals   = 1U << 6,
  kFlagObstructed  = 1U << 7,
  kFlagIncomplete  = 1U << 8,
  kFlagProperty    = 1U << 9, // property-only change
};

using StatusMask = std::uint32_t;

// path (repo-relative, '/' separated) -> flags
using WorkingCopyStatus = std::map<std::string, StatusMask>;

[[nodiscard]] inline bool has_flag(StatusMask mask, StatusFlag flag) {
  return (mask & flag) != 0U;
}

// Flags for `path`, or 0 when the status has no entry for it.
[[nodiscard]] StatusMask flags_for(const WorkingCopyStatus &status, const std::string &path);

// Parse the plain-text output of `svn status`. Lines that describe no
// change (blank lines, "Performing status on external item ..." banners,
// tree-conflict detail lines) are skipped.
[[nodiscard]] WorkingCopyStatus parse_svn_status(std::string_view output);

// Short human form, e.g. "M", "A", "D", "?", "MC".
[[nodiscard]] std::string describe_flags(StatusMask mask);

} // namespace shipit
