#include "shipit/log.hpp"

#include <iostream>

int main() {
  namespace lvl = spdlog::level;

  if (shipit::parse_log_level("debug", lvl::warn) != lvl::debug ||
      shipit::parse_log_level("trace", lvl::warn) != lvl::trace ||
      shipit::parse_log_level("warn", lvl::info) != lvl::warn) {
    std::cerr << "known level names must parse\n";
    return 1;
  }
  // "off" is a real level, not a parse failure
  if (shipit::parse_log_level("off", lvl::warn) != lvl::off) {
    std::cerr << "off must switch logging off\n";
    return 1;
  }
  // A typo keeps the default instead of silencing everything
  if (shipit::parse_log_level("debgu", lvl::warn) != lvl::warn ||
      shipit::parse_log_level("", lvl::debug) != lvl::debug) {
    std::cerr << "unknown level names must fall back\n";
    return 1;
  }

  std::cout << "log OK\n";
  return 0;
}
