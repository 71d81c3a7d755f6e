#include "shipit/log.hpp"

#include "shipit/consts.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace shipit {

spdlog::level::level_enum parse_log_level(std::string_view name,
                                          spdlog::level::level_enum fallback) {
  // from_str maps unknown names to off
  const std::string s(name);
  const auto level = spdlog::level::from_str(s);
  if (level == spdlog::level::off && s != "off")
    return fallback;
  return level;
}

void init_logging(bool verbose) {
  auto logger = spdlog::stderr_color_mt("shipit");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%^%l%$] %v");

  auto level = verbose ? spdlog::level::debug : spdlog::level::warn;
  if (const char *env = std::getenv(consts::kEnvLogLevel); env && *env) {
    if (parse_log_level(env, spdlog::level::n_levels) == spdlog::level::n_levels)
      spdlog::warn("unknown {} value '{}', keeping the default level", consts::kEnvLogLevel, env);
    level = parse_log_level(env, level);
  }
  spdlog::set_level(level);
}

} // namespace shipit
