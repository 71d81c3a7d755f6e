#include "shipit/errors.hpp"

namespace shipit {

ConflictError::ConflictError(std::string directory, std::string path)
    : Error("This commit includes the directory '" + directory +
            "', but it contains a modified path ('" + path +
            "') which is NOT included in the commit. Subversion can not handle this "
            "operation and will commit the path anyway. You need to sort out the working "
            "copy changes to '" + path + "' before you may proceed with the commit."),
      directory_(std::move(directory)), path_(std::move(path)) {}

namespace {

std::string empty_commit_message(const std::vector<std::string> &missing) {
  std::string msg = "There is nothing left to commit. None of the modified paths exist.";
  for (const auto &p : missing)
    msg += "\n    " + p;
  return msg;
}

} // namespace

EmptyCommitError::EmptyCommitError(std::vector<std::string> missing_paths)
    : Error(empty_commit_message(missing_paths)), missing_paths_(std::move(missing_paths)) {}

} // namespace shipit
