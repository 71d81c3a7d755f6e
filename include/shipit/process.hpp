#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace shipit {

struct ProcessResult {
  int exit_code{0};   // 128 + signal when the child was killed
  std::string output; // stdout + stderr, only when captured
};

enum class Output : std::uint8_t { Capture, Inherit };

// Run argv[0] (looked up in PATH) in `cwd` without a shell. `env` entries
// are set in the child only. Throws ExternalToolError when the program
// cannot be started at all.
ProcessResult run_process(const std::vector<std::string> &argv, const std::filesystem::path &cwd,
                          const std::map<std::string, std::string> &env, Output mode);

} // namespace shipit
