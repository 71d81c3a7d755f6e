#pragma once
#include "shipit/status.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace shipit {

// Environment handed to the commit child process only.
struct CommitEnv {
  std::map<std::string, std::string> vars;
  std::string encoding; // passed as --encoding when non-empty
};

// Locale and encoding pinned so multi-byte commit messages survive.
CommitEnv utf8_commit_env();

class Vcs {
public:
  virtual ~Vcs() = default;

  virtual WorkingCopyStatus status(const std::filesystem::path &root) = 0;

  // Exit code of the commit; 0 on success.
  virtual int commit(const std::filesystem::path &root, const std::set<std::string> &paths,
                     const std::string &message, const CommitEnv &env) = 0;
};

// Drives the `svn` command-line client.
class SvnClient : public Vcs {
public:
  explicit SvnClient(std::string program = "svn");

  WorkingCopyStatus status(const std::filesystem::path &root) override;
  int commit(const std::filesystem::path &root, const std::set<std::string> &paths,
             const std::string &message, const CommitEnv &env) override;

  // argv for `svn commit`, exposed for --show style previews and tests.
  [[nodiscard]] std::vector<std::string> commit_args(const std::set<std::string> &paths,
                                                     const std::string &message,
                                                     const CommitEnv &env) const;

private:
  std::string program_;
};

} // namespace shipit
