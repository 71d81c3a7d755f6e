// String and path helpers
#include "shipit/util.hpp"

#include "shipit/consts.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace shipit {

std::optional<std::uint64_t> parse_revision_id(std::string_view str) {
  if (!str.empty() && (str.front() == consts::kRevisionPrefix || str.front() == 'd')) {
    str.remove_prefix(1);
  }
  if (str.empty() ||
      !std::ranges::all_of(str, [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
    return std::nullopt;
  }
  std::uint64_t id = 0;
  const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), id);
  if (ec != std::errc{} || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return id;
}

namespace pathutil {

std::string normalize(std::string_view path) {
  while (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  return std::string(path);
}

bool is_descendant(std::string_view path, std::string_view dir) {
  const std::string p = normalize(path);
  std::string d = normalize(dir);
  if (d.empty() || d == ".") {
    // the working-copy root contains everything but itself
    return !p.empty() && p != ".";
  }
  if (d != "/") {
    d.push_back('/');
  }
  return p.size() > d.size() && std::string_view(p).starts_with(d);
}

bool escapes_root(std::string_view path) {
  if (path.starts_with('/'))
    return true;
  while (!path.empty()) {
    const auto slash = path.find('/');
    if (path.substr(0, slash) == "..")
      return true;
    if (slash == std::string_view::npos)
      break;
    path.remove_prefix(slash + 1);
  }
  return false;
}

} // namespace pathutil

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  while (!text.empty()) {
    const auto nl = text.find(consts::kLF);
    if (nl == std::string_view::npos) {
      lines.emplace_back(text);
      break;
    }
    lines.emplace_back(text.substr(0, nl));
    text.remove_prefix(nl + 1);
  }
  return lines;
}

} // namespace strutil

} // namespace shipit
