#pragma once
#include <spdlog/common.h>

#include <string_view>

namespace shipit {

// Route spdlog to stderr. Level: warn, debug with `verbose`, or whatever
// $SHIPIT_LOG names (trace, debug, info, warn, error, critical, off).
void init_logging(bool verbose);

// Level named by `name`, or `fallback` when spdlog does not know the name.
spdlog::level::level_enum parse_log_level(std::string_view name,
                                          spdlog::level::level_enum fallback);

} // namespace shipit
