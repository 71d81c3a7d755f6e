#pragma once
#include <filesystem>
#include <map>
#include <string>

namespace shipit {

// Answers filesystem questions about repo-relative paths.
class ExistenceOracle {
public:
  virtual ~ExistenceOracle() = default;

  // Regular file, directory or a symlink whose target resolves.
  [[nodiscard]] virtual bool exists(const std::string &path) const = 0;
  [[nodiscard]] virtual bool is_symlink(const std::string &path) const = 0;
};

// Live lookups under a working-copy root.
class FilesystemOracle : public ExistenceOracle {
public:
  explicit FilesystemOracle(std::filesystem::path root);

  [[nodiscard]] bool exists(const std::string &path) const override;
  [[nodiscard]] bool is_symlink(const std::string &path) const override;

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  [[nodiscard]] std::filesystem::path resolve(const std::string &path) const;

  std::filesystem::path root_;
};

// Memoises another oracle for the lifetime of one reconciliation. The
// working copy is treated as a read-only snapshot while it is alive.
class CachingOracle : public ExistenceOracle {
public:
  explicit CachingOracle(const ExistenceOracle &inner) : inner_{inner} {}

  [[nodiscard]] bool exists(const std::string &path) const override;
  [[nodiscard]] bool is_symlink(const std::string &path) const override;

private:
  const ExistenceOracle &inner_;
  mutable std::map<std::string, bool> exists_;
  mutable std::map<std::string, bool> symlink_;
};

} // namespace shipit
