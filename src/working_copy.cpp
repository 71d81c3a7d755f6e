#include "shipit/working_copy.hpp"

#include "shipit/fs.hpp"

#include <utility>

namespace stdfs = std::filesystem;

namespace shipit {

WorkingCopy::WorkingCopy(stdfs::path root)
    : root_(std::move(root)), config_(load_project_config(root_)) {}

std::optional<WorkingCopy> WorkingCopy::discover(const stdfs::path &start) {
  std::error_code ec;
  stdfs::path dir = stdfs::weakly_canonical(stdfs::absolute(start), ec);
  if (ec)
    dir = stdfs::absolute(start);
  for (;;) {
    if (fs::exists(dir / consts::kProjectConfig))
      return WorkingCopy{dir};
    if (!dir.has_parent_path() || dir.parent_path() == dir)
      return std::nullopt;
    dir = dir.parent_path();
  }
}

Backend WorkingCopy::backend() const {
  if (fs::exists(root_ / consts::kSvnDir))
    return Backend::Subversion;
  if (fs::exists(root_ / consts::kGitDir))
    return Backend::Git;
  return Backend::Unknown;
}

} // namespace shipit
