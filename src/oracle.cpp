#include "shipit/oracle.hpp"

#include "shipit/fs.hpp"
#include "shipit/util.hpp"

#include <utility>

namespace shipit {

FilesystemOracle::FilesystemOracle(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FilesystemOracle::resolve(const std::string &path) const {
  return root_ / pathutil::normalize(path);
}

// Paths outside the root are never looked up, so they read as missing.
bool FilesystemOracle::exists(const std::string &path) const {
  return !pathutil::escapes_root(path) && fs::exists(resolve(path));
}

bool FilesystemOracle::is_symlink(const std::string &path) const {
  return !pathutil::escapes_root(path) && fs::is_symlink(resolve(path));
}

bool CachingOracle::exists(const std::string &path) const {
  if (const auto it = exists_.find(path); it != exists_.end())
    return it->second;
  const bool v = inner_.exists(path);
  exists_.emplace(path, v);
  return v;
}

bool CachingOracle::is_symlink(const std::string &path) const {
  if (const auto it = symlink_.find(path); it != symlink_.end())
    return it->second;
  const bool v = inner_.is_symlink(path);
  symlink_.emplace(path, v);
  return v;
}

} // namespace shipit
