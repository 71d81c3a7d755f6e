#include "shipit/process.hpp"

#include "shipit/errors.hpp"
#include "shipit/unique_fd.hpp"

#include <spdlog/spdlog.h>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace shipit {

namespace {

std::string read_all(int fd) {
  std::string data;
  std::array<char, 4096> buf{};
  for (;;) {
    const ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      break;
    data.append(buf.data(), static_cast<std::size_t>(n));
  }
  return data;
}

int wait_child(pid_t pid) {
  int st = 0;
  while (::waitpid(pid, &st, 0) < 0) {
    if (errno != EINTR)
      throw ExternalToolError(std::string("waitpid failed: ") + std::strerror(errno), -1);
  }
  return WIFEXITED(st) ? WEXITSTATUS(st) : 128 + WTERMSIG(st);
}

} // namespace

ProcessResult run_process(const std::vector<std::string> &argv, const std::filesystem::path &cwd,
                          const std::map<std::string, std::string> &env, Output mode) {
  if (argv.empty())
    throw ExternalToolError("run_process: empty argv", -1);

  spdlog::debug("[proc] exec {} ({} args) in {}", argv[0], argv.size() - 1, cwd.string());

  // exec errors come back through this pipe; it closes on a successful exec
  CloexecPipe status = make_cloexec_pipe();
  CloexecPipe out;
  if (mode == Output::Capture)
    out = make_cloexec_pipe();

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &s : argv)
    cargv.push_back(const_cast<char *>(s.c_str()));
  cargv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0)
    throw ExternalToolError(std::string("fork failed: ") + std::strerror(errno), -1);

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      int err = errno;
      (void)!::write(status.write.get(), &err, sizeof(err));
      _exit(127);
    }
    for (const auto &[k, v] : env)
      ::setenv(k.c_str(), v.c_str(), 1);
    if (mode == Output::Capture) {
      ::dup2(out.write.get(), STDOUT_FILENO);
      ::dup2(out.write.get(), STDERR_FILENO);
    }
    ::execvp(cargv[0], cargv.data());
    int err = errno;
    (void)!::write(status.write.get(), &err, sizeof(err));
    _exit(127);
  }

  status.write.reset();
  out.write.reset();

  ProcessResult result;
  if (mode == Output::Capture)
    result.output = read_all(out.read.get());

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(status.read.get(), &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  result.exit_code = wait_child(pid);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    throw ExternalToolError("failed to start '" + argv[0] + "': " + std::strerror(child_errno),
                            result.exit_code);
  }
  spdlog::debug("[proc] {} exited rc={}", argv[0], result.exit_code);
  return result;
}

} // namespace shipit
