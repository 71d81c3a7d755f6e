#include "shipit/consts.hpp"
#include "shipit/errors.hpp"
#include "shipit/hash.hpp"
#include "shipit/review.hpp"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <netdb.h>
#include <sstream>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace shipit {

namespace {

[[nodiscard]] auto sys_error(std::string_view what, int err) -> TransportError {
  return TransportError(std::string(what) + ": " + std::strerror(err));
}

[[nodiscard]] auto connect_tcp(const std::string &host, int port) -> UniqueFd {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *res = nullptr;
  const std::string port_s = std::to_string(port);

  if (const int rc = ::getaddrinfo(host.c_str(), port_s.c_str(), &hints, &res); rc != 0) {
    std::ostringstream os;
    os << "getaddrinfo failed for " << host << ":" << port << ": " << gai_strerror(rc);
    throw TransportError(os.str());
  }

  UniqueFd sock;
  int last_errno = 0;
  for (addrinfo *rp = res; rp != nullptr; rp = rp->ai_next) {
    const int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (fd == -1) {
      last_errno = errno;
      continue;
    }
    if (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0) {
      sock.reset(fd);
      break;
    }
    last_errno = errno;
    ::close(fd);
  }
  ::freeaddrinfo(res);

  if (!sock) {
    throw sys_error("connect to " + host + ":" + port_s, last_errno);
  }
  return sock;
}

void send_all(int fd, const void *buf, size_t n) {
  const auto *p = static_cast<const std::uint8_t *>(buf);
  while (n != 0U) {
    const ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR)
      continue;
    if (w <= 0) {
      throw sys_error("send", errno);
    }
    p += static_cast<size_t>(w);
    n -= static_cast<size_t>(w);
  }
}

void send_line(int fd, std::string_view s) {
  std::string t(s);
  t.push_back(consts::kLF);
  send_all(fd, t.data(), t.size());
}

void recv_exact(int fd, char *dst, size_t n) {
  size_t got = 0;
  while (got < n) {
    const ssize_t r = ::recv(fd, dst + got, n - got, 0);
    if (r < 0 && errno == EINTR)
      continue;
    if (r == 0)
      throw TransportError("review service closed the connection");
    if (r < 0)
      throw sys_error("recv", errno);
    got += static_cast<size_t>(r);
  }
}

[[nodiscard]] auto recv_line(int fd) -> std::string {
  std::string s;
  char c = '\0';
  for (;;) {
    recv_exact(fd, &c, 1);
    if (c == consts::kLF) {
      break;
    }
    s.push_back(c);
  }
  if (!s.empty() && s.back() == '\r')
    s.pop_back();
  return s;
}

// "<id>\t<source_path>\t<name>"
[[nodiscard]] auto parse_revision_line(std::string_view line) -> RevisionRef {
  const auto t1 = line.find(consts::kTab);
  const auto t2 = t1 == std::string_view::npos ? t1 : line.find(consts::kTab, t1 + 1);
  if (t2 == std::string_view::npos) {
    throw TransportError("malformed revision line: '" + std::string(line) + "'");
  }
  RevisionRef ref;
  const std::string_view id = line.substr(0, t1);
  const auto [ptr, ec] = std::from_chars(id.data(), id.data() + id.size(), ref.id);
  if (ec != std::errc{} || ptr != id.data() + id.size()) {
    throw TransportError("malformed revision id: '" + std::string(id) + "'");
  }
  ref.source_path = std::string(line.substr(t1 + 1, t2 - t1 - 1));
  ref.name = std::string(line.substr(t2 + 1));
  return ref;
}

} // namespace

TcpReviewService::TcpReviewService(Endpoint endpoint, UserConfig credentials)
    : endpoint_(std::move(endpoint)), credentials_(std::move(credentials)) {}

int TcpReviewService::connection() {
  if (sock_)
    return sock_.get();

  spdlog::debug("[review] connecting to {}:{}", endpoint_.host, endpoint_.port);
  UniqueFd sock = connect_tcp(endpoint_.host, endpoint_.port);
  send_line(sock.get(), consts::kHelloLine);

  const std::string token = std::to_string(std::time(nullptr));
  send_line(sock.get(), std::string(consts::kOpAuth) + credentials_.user + " " + token + " " +
                            auth_signature(token, credentials_.certificate));
  sock_ = std::move(sock);
  try {
    (void)read_reply();
  } catch (const Error &) {
    sock_.reset();
    throw;
  }
  return sock_.get();
}

std::size_t TcpReviewService::read_reply() {
  const std::string line = recv_line(sock_.get());
  const std::string_view sv{line};
  if (sv.starts_with(consts::kTokErr)) {
    sock_.reset();
    throw TransportError(std::string(sv.substr(consts::kTokErr.size())));
  }
  std::size_t n = 0;
  if (sv.starts_with(consts::kTokOk)) {
    const std::string_view count = sv.substr(consts::kTokOk.size());
    const auto [ptr, ec] = std::from_chars(count.data(), count.data() + count.size(), n);
    if (ec == std::errc{} && ptr == count.data() + count.size()) {
      return n;
    }
  }
  sock_.reset();
  throw TransportError("unexpected reply from review service: '" + line + "'");
}

std::size_t TcpReviewService::call(const std::string &request) {
  const int fd = connection();
  spdlog::debug("[review] -> {}", request);
  send_line(fd, request);
  return read_reply();
}

std::vector<RevisionRef> TcpReviewService::find_committable(const std::string &owner) {
  const std::size_t n = call(std::string(consts::kOpFind) + owner);
  std::vector<RevisionRef> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(parse_revision_line(recv_line(sock_.get())));
  }
  return out;
}

DeclaredPathSet TcpReviewService::declared_paths(std::uint64_t revision_id) {
  const std::size_t n = call(std::string(consts::kOpPaths) + std::to_string(revision_id));
  DeclaredPathSet out;
  for (std::size_t i = 0; i < n; ++i) {
    out.insert(recv_line(sock_.get()));
  }
  return out;
}

std::string TcpReviewService::commit_message(std::uint64_t revision_id) {
  const std::size_t n = call(std::string(consts::kOpMessage) + std::to_string(revision_id));
  std::string msg(n, '\0');
  if (n != 0U) {
    recv_exact(sock_.get(), msg.data(), n);
  }
  return msg;
}

void TcpReviewService::mark_committed(std::uint64_t revision_id) {
  (void)call(std::string(consts::kOpMark) + std::to_string(revision_id));
}

} // namespace shipit
