#include "cli/context.hpp"

#include "shipit/consts.hpp"
#include "shipit/errors.hpp"

#include <filesystem>
#include <string>
#include <utility>

namespace shipit::cli {

WorkingCopy require_working_copy() {
  auto wc = WorkingCopy::discover(std::filesystem::current_path());
  if (!wc) {
    throw UsageError("no " + std::string(consts::kProjectConfig) +
                     " found here or in any parent directory");
  }
  return std::move(*wc);
}

std::unique_ptr<TcpReviewService> open_review(const WorkingCopy &wc, const UserConfig &user) {
  if (wc.config().review_uri.empty()) {
    throw UsageError(wc.config_file().string() + " does not set " +
                     std::string(consts::kKeyReviewUri));
  }
  if (user.user.empty()) {
    throw UsageError("no user configured; add 'user: <name>' to " +
                     user_config_path().string());
  }
  return std::make_unique<TcpReviewService>(parse_review_uri(wc.config().review_uri), user);
}

} // namespace shipit::cli
