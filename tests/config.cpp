#include "shipit/config.hpp"
#include "shipit/errors.hpp"
#include "shipit/working_copy.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("shipit_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    write_file(root / ".shipitconfig", "# project settings\n"
                                       "project_id: tools\n"
                                       "review_uri:   tcp://review.example.com:9000  \n"
                                       "remote_hooks_installed: true\n"
                                       "unknown_key: ignored\n");
    fs::create_directories(root / ".svn");
    fs::create_directories(root / "src" / "deep");

    // Discovery walks up from a nested directory
    auto wc = shipit::WorkingCopy::discover(root / "src" / "deep");
    if (!wc) {
      std::cerr << "working copy not discovered\n";
      return 1;
    }
    if (!fs::equivalent(wc->root(), root)) {
      std::cerr << "wrong root: " << wc->root() << "\n";
      return 1;
    }
    if (wc->config().project_id != "tools" ||
        wc->config().review_uri != "tcp://review.example.com:9000" ||
        !wc->config().remote_hooks_installed) {
      std::cerr << "project config mismatch\n";
      return 1;
    }
    if (wc->backend() != shipit::Backend::Subversion) {
      std::cerr << "expected svn backend\n";
      return 1;
    }

    // Defaults when keys are absent
    const fs::path bare = root / "bare";
    write_file(bare / ".shipitconfig", "project_id: bare\n");
    const shipit::WorkingCopy bare_wc{bare};
    if (bare_wc.config().remote_hooks_installed || !bare_wc.config().review_uri.empty()) {
      std::cerr << "defaults mismatch\n";
      return 1;
    }
    if (bare_wc.backend() != shipit::Backend::Unknown) {
      std::cerr << "bare dir has no VCS\n";
      return 1;
    }

    // User config and SHIPIT_RC override
    const fs::path rc = root / "rc";
    write_file(rc, "user: alice\ncertificate: s3cr3t\n");
    ::setenv("SHIPIT_RC", rc.c_str(), 1);
    if (shipit::user_config_path() != rc) {
      std::cerr << "SHIPIT_RC not honoured\n";
      return 1;
    }
    const auto user = shipit::load_user_config(shipit::user_config_path());
    if (user.user != "alice" || user.certificate != "s3cr3t") {
      std::cerr << "user config mismatch\n";
      return 1;
    }

    // Review URI parsing
    const auto ep = shipit::parse_review_uri("tcp://review.example.com:9000");
    if (ep.host != "review.example.com" || ep.port != 9000) {
      std::cerr << "uri parse mismatch\n";
      return 1;
    }
    if (shipit::parse_review_uri("tcp://localhost").port != 7418) {
      std::cerr << "default port mismatch\n";
      return 1;
    }
    for (const char *bad : {"http://x", "tcp://", "tcp://h:abc", "tcp://h:70000"}) {
      bool threw = false;
      try {
        (void)shipit::parse_review_uri(bad);
      } catch (const shipit::UsageError &) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "expected UsageError for " << bad << "\n";
        return 1;
      }
    }

    std::cout << "config OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
