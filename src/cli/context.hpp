#pragma once
#include "shipit/review.hpp"
#include "shipit/working_copy.hpp"

#include <memory>

namespace shipit::cli {

// Working copy around the current directory; UsageError if there is none.
WorkingCopy require_working_copy();

// Review client for the working copy's review_uri and the user's credentials.
std::unique_ptr<TcpReviewService> open_review(const WorkingCopy &wc, const UserConfig &user);

} // namespace shipit::cli
