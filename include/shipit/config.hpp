#pragma once
#include <filesystem>
#include <map>
#include <string>

namespace shipit {

// .shipitconfig at the working-copy root
struct ProjectConfig {
  std::string project_id;
  std::string review_uri;              // tcp://host[:port]
  bool remote_hooks_installed = false; // server marks revisions committed itself
};

// ~/.shipitrc
struct UserConfig {
  std::string user;
  std::string certificate;
};

struct Endpoint {
  std::string host;
  int port;
};

// Read "key: value" lines; '#' starts a comment line. Empty map if missing.
std::map<std::string, std::string> load_key_values(const std::filesystem::path& path);

ProjectConfig load_project_config(const std::filesystem::path& root);

// $SHIPIT_RC, else $HOME/.shipitrc
std::filesystem::path user_config_path();
UserConfig load_user_config(const std::filesystem::path& path);

// "tcp://host[:port]" -> endpoint; throws UsageError on anything else
Endpoint parse_review_uri(const std::string& uri);

} // namespace shipit
