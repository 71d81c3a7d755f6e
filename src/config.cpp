#include "shipit/config.hpp"

#include "shipit/consts.hpp"
#include "shipit/errors.hpp"
#include "shipit/fs.hpp"
#include "shipit/util.hpp"

#include <charconv>
#include <system_error>
#include <cstdlib>
#include <sstream>
#include <string_view>

namespace shipit {

namespace {

bool parse_bool(std::string_view v) {
  return v == "true" || v == "yes" || v == "1" || v == "on";
}

std::string value_or_empty(const std::map<std::string, std::string> &kv, std::string_view key) {
  const auto it = kv.find(std::string(key));
  return it == kv.end() ? std::string{} : it->second;
}

} // namespace

std::map<std::string, std::string> load_key_values(const std::filesystem::path &path) {
  std::map<std::string, std::string> out;
  if (!fs::exists(path))
    return out;

  std::istringstream iss(fs::read_file(path));
  std::string line;
  while (std::getline(iss, line)) {
    const std::string t = strutil::trim(line);
    if (t.empty() || t[0] == '#')
      continue; // allow comments
    const auto colon = t.find(':');
    if (colon == std::string::npos)
      continue;
    out[strutil::trim(std::string_view(t).substr(0, colon))] =
        strutil::trim(std::string_view(t).substr(colon + 1));
  }
  return out;
}

ProjectConfig load_project_config(const std::filesystem::path &root) {
  const auto kv = load_key_values(root / consts::kProjectConfig);
  ProjectConfig cfg;
  cfg.project_id = value_or_empty(kv, consts::kKeyProjectId);
  cfg.review_uri = value_or_empty(kv, consts::kKeyReviewUri);
  cfg.remote_hooks_installed = parse_bool(value_or_empty(kv, consts::kKeyRemoteHooks));
  return cfg;
}

std::filesystem::path user_config_path() {
  if (const char *env = std::getenv(consts::kEnvUserConfig); env && *env)
    return env;
  if (const char *home = std::getenv("HOME"); home && *home)
    return std::filesystem::path(home) / consts::kUserConfig;
  return std::filesystem::path(consts::kUserConfig);
}

UserConfig load_user_config(const std::filesystem::path &path) {
  const auto kv = load_key_values(path);
  return UserConfig{.user = value_or_empty(kv, consts::kKeyUser),
                    .certificate = value_or_empty(kv, consts::kKeyCertificate)};
}

Endpoint parse_review_uri(const std::string &uri) {
  if (!std::string_view(uri).starts_with(consts::kTcpScheme)) {
    throw UsageError("review_uri must look like tcp://host[:port], got '" + uri + "'");
  }
  const std::string rest = uri.substr(consts::kTcpScheme.size());
  const auto colon = rest.find(':');
  Endpoint ep{.host = rest.substr(0, colon), .port = consts::portNumber};
  if (ep.host.empty()) {
    throw UsageError("review_uri has no host: '" + uri + "'");
  }
  if (colon != std::string::npos) {
    const std::string_view port = std::string_view(rest).substr(colon + 1);
    const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), ep.port);
    if (ec != std::errc{} || ptr != port.data() + port.size() || ep.port <= 0 ||
        ep.port > 65535) {
      throw UsageError("review_uri has a bad port: '" + uri + "'");
    }
  }
  return ep;
}

} // namespace shipit
