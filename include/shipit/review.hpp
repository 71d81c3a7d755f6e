#pragma once
#include "shipit/config.hpp"
#include "shipit/reconcile.hpp"
#include "shipit/unique_fd.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace shipit {

struct RevisionRef {
  std::uint64_t id{0};
  std::string name;        // revision title
  std::string source_path; // working-copy root the revision was created from
};

// The code review service that owns revisions.
class ReviewService {
public:
  virtual ~ReviewService() = default;

  // Accepted revisions owned by `owner`, in the service's order.
  virtual std::vector<RevisionRef> find_committable(const std::string &owner) = 0;
  virtual DeclaredPathSet declared_paths(std::uint64_t revision_id) = 0;
  virtual std::string commit_message(std::uint64_t revision_id) = 0;
  virtual void mark_committed(std::uint64_t revision_id) = 0;
};

// Line protocol over TCP. One connection per client, opened and
// authenticated on first use. Failures are TransportError.
class TcpReviewService : public ReviewService {
public:
  TcpReviewService(Endpoint endpoint, UserConfig credentials);

  std::vector<RevisionRef> find_committable(const std::string &owner) override;
  DeclaredPathSet declared_paths(std::uint64_t revision_id) override;
  std::string commit_message(std::uint64_t revision_id) override;
  void mark_committed(std::uint64_t revision_id) override;

private:
  int connection();
  // Sends `request`, checks "OK <n>", returns n.
  std::size_t call(const std::string &request);
  std::size_t read_reply();

  Endpoint endpoint_;
  UserConfig credentials_;
  UniqueFd sock_;
};

} // namespace shipit
