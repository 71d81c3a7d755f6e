#include "shipit/status.hpp"

#include "shipit/util.hpp"

#include <array>
#include <cstddef>
#include <utility>

namespace shipit {

namespace {

// `svn status` prints seven status columns, a space, then the path.
constexpr std::size_t kPathColumn = 8;

constexpr std::string_view kExternalBanner = "Performing status on external item";

StatusMask item_flags(char c) {
  switch (c) {
  case 'M':
    return kFlagModified;
  case 'A':
    return kFlagAdded;
  case 'D':
    return kFlagDeleted;
  case 'R':
    return kFlagAdded | kFlagDeleted; // replaced
  case 'C':
    return kFlagConflicted;
  case '?':
    return kFlagUnversioned;
  case '!':
    return kFlagMissing;
  case '~':
    return kFlagObstructed;
  case 'X':
    return kFlagExternals;
  default:
    return 0; // ' ', 'I' (ignored) and anything unknown
  }
}

StatusMask property_flags(char c) {
  switch (c) {
  case 'M':
    return kFlagProperty;
  case 'C':
    return kFlagConflicted;
  default:
    return 0;
  }
}

} // namespace

StatusMask flags_for(const WorkingCopyStatus &status, const std::string &path) {
  const auto it = status.find(path);
  return it == status.end() ? 0U : it->second;
}

WorkingCopyStatus parse_svn_status(std::string_view output) {
  WorkingCopyStatus out;
  for (std::string line : strutil::split_lines(output)) {
    strutil::rstrip_newlines(line);
    if (line.size() <= kPathColumn)
      continue;
    if (line.starts_with(kExternalBanner))
      continue;
    if (line[kPathColumn - 1] != ' ')
      continue; // detail line ("      >   local edit, ...") or foreign output

    StatusMask mask = item_flags(line[0]) | property_flags(line[1]);
    if (line[6] == 'C')
      mask |= kFlagConflicted; // tree conflict
    if (mask == 0U)
      continue;

    std::string path = line.substr(kPathColumn);
    while (path.size() > 1 && path.back() == '/')
      path.pop_back();
    out[path] |= mask;
  }
  return out;
}

std::string describe_flags(StatusMask mask) {
  static constexpr std::array<std::pair<StatusFlag, char>, 10> kCodes{{
      {kFlagModified, 'M'},
      {kFlagAdded, 'A'},
      {kFlagDeleted, 'D'},
      {kFlagUnversioned, '?'},
      {kFlagConflicted, 'C'},
      {kFlagMissing, '!'},
      {kFlagExternals, 'X'},
      {kFlagObstructed, '~'},
      {kFlagIncomplete, 'I'},
      {kFlagProperty, 'P'},
  }};
  std::string s;
  for (const auto &[flag, code] : kCodes) {
    if (has_flag(mask, flag))
      s.push_back(code);
  }
  return s;
}

} // namespace shipit
