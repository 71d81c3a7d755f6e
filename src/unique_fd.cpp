#include "shipit/unique_fd.hpp"

#include "shipit/errors.hpp"

#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace shipit {

CloexecPipe make_cloexec_pipe() {
  int pfd[2];
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) != 0)
    throw ExternalToolError(std::string("pipe failed: ") + std::strerror(errno), -1);
#else
  if (::pipe(pfd) != 0)
    throw ExternalToolError(std::string("pipe failed: ") + std::strerror(errno), -1);
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
#endif
  return CloexecPipe{UniqueFd{pfd[0]}, UniqueFd{pfd[1]}};
}

} // namespace shipit
