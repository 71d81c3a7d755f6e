#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shipit {

// Parse "123" or "D123" into a revision id.
auto parse_revision_id(std::string_view str) -> std::optional<std::uint64_t>;

// Path helpers for repo-relative, '/' separated paths
namespace pathutil {
  // Drop trailing slashes ("dir/" -> "dir"); "/" stays "/".
  auto normalize(std::string_view path) -> std::string;

  // True when `path` lies strictly below `dir`, compared by components:
  // "dir/x.txt" is below "dir/", "dirx/a" is not below "dir", and a path is
  // never below itself.
  auto is_descendant(std::string_view path, std::string_view dir) -> bool;

  // True for absolute paths and paths with a ".." component, which would
  // leave the working copy when joined to its root.
  auto escapes_root(std::string_view path) -> bool;
}

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip leading/trailing spaces, tabs and CR
  auto trim(std::string_view sv) -> std::string;

  auto split_lines(std::string_view text) -> std::vector<std::string>;
}

}
