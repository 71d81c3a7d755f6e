#pragma once
#include "shipit/config.hpp"
#include "shipit/consts.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>

namespace shipit {

enum class Backend : std::uint8_t { Subversion, Git, Unknown };

class WorkingCopy {
public:
  explicit WorkingCopy(std::filesystem::path root);

  // Walk up from `start` to the first directory holding .shipitconfig.
  static std::optional<WorkingCopy> discover(const std::filesystem::path &start);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return root_ / consts::kProjectConfig;
  }
  [[nodiscard]] const ProjectConfig &config() const { return config_; }

  [[nodiscard]] auto backend() const -> Backend;

private:
  std::filesystem::path root_;
  ProjectConfig config_;
};

} // namespace shipit
