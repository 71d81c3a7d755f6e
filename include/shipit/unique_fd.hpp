#pragma once
#include <unistd.h>

namespace shipit {

// Owns one end of a review-service socket or a child-process pipe. Closed on
// destruction; moves hand the descriptor over.
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.release()} {}
  UniqueFd &operator=(UniqueFd &&other) noexcept {
    if (this != &other)
      reset(other.release());
    return *this;
  }

  ~UniqueFd() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
  [[nodiscard]] explicit operator bool() const noexcept { return valid(); }
  [[nodiscard]] int get() const noexcept { return fd_; }

  // Give up ownership without closing.
  [[nodiscard]] int release() noexcept {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(int fd = -1) noexcept {
    if (fd_ >= 0 && fd_ != fd)
      ::close(fd_); // nothing useful to do with a close error here
    fd_ = fd;
  }

private:
  int fd_{-1};
};

// Both ends of a pipe, close-on-exec so a child only keeps what it dup2()s.
struct CloexecPipe {
  UniqueFd read;
  UniqueFd write;
};

// Throws ExternalToolError when the pipe cannot be created.
CloexecPipe make_cloexec_pipe();

} // namespace shipit
