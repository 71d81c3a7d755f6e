#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace shipit {

// Base of every failure that ends a shipit invocation.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Wrong revision, nothing committable, unsupported backend, bad arguments.
class UsageError : public Error {
public:
  using Error::Error;
};

// A declared directory would sweep in a locally modified path that is not
// part of the revision.
class ConflictError : public Error {
public:
  ConflictError(std::string directory, std::string path);

  [[nodiscard]] const std::string &directory() const { return directory_; }
  [[nodiscard]] const std::string &path() const { return path_; }

private:
  std::string directory_;
  std::string path_;
};

// The operator declined to continue past a warning.
class AbortError : public Error {
public:
  AbortError() : Error("Aborted.") {}
};

// Every declared path vanished. Carries the missing paths so the operator
// sees what was dropped.
class EmptyCommitError : public Error {
public:
  explicit EmptyCommitError(std::vector<std::string> missing_paths);

  [[nodiscard]] const std::vector<std::string> &missing_paths() const { return missing_paths_; }

private:
  std::vector<std::string> missing_paths_;
};

// Review service unreachable or returned an error.
class TransportError : public Error {
public:
  using Error::Error;
};

// An external program (svn) exited non-zero.
class ExternalToolError : public Error {
public:
  ExternalToolError(const std::string &what, int exit_code, std::string output = {})
      : Error(what), exit_code_{exit_code}, output_(std::move(output)) {}

  [[nodiscard]] int exit_code() const noexcept { return exit_code_; }
  [[nodiscard]] const std::string &output() const { return output_; }

private:
  int exit_code_;
  std::string output_;
};

} // namespace shipit
