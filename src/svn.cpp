#include "shipit/vcs.hpp"

#include "shipit/consts.hpp"
#include "shipit/errors.hpp"
#include "shipit/process.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace shipit {

CommitEnv utf8_commit_env() {
  CommitEnv env;
  env.vars["LANG"] = std::string(consts::kCommitLocale);
  env.vars["LC_ALL"] = std::string(consts::kCommitLocale);
  env.encoding = std::string(consts::kCommitEncoding);
  return env;
}

SvnClient::SvnClient(std::string program) : program_(std::move(program)) {}

WorkingCopyStatus SvnClient::status(const std::filesystem::path &root) {
  // Paths come back in the child's locale and must match the declared set
  // byte for byte, so pin the commit's UTF-8 locale for LC_CTYPE. LC_ALL
  // would mask LC_MESSAGES; an empty value counts as unset.
  auto env = utf8_commit_env().vars;
  env["LC_ALL"] = "";
  env["LC_CTYPE"] = std::string(consts::kCommitLocale);
  env["LC_MESSAGES"] = "C";
  const auto res = run_process({program_, "status", "--non-interactive"}, root, env,
                               Output::Capture);
  if (res.exit_code != 0) {
    throw ExternalToolError("'svn status' failed with exit code " +
                                std::to_string(res.exit_code) + ":\n" + res.output,
                            res.exit_code, res.output);
  }
  auto st = parse_svn_status(res.output);
  spdlog::debug("[svn] status: {} changed path(s)", st.size());
  return st;
}

std::vector<std::string> SvnClient::commit_args(const std::set<std::string> &paths,
                                                const std::string &message,
                                                const CommitEnv &env) const {
  std::vector<std::string> args{program_, "commit"};
  if (!env.encoding.empty()) {
    args.emplace_back("--encoding");
    args.push_back(env.encoding);
  }
  args.emplace_back("-m");
  args.push_back(message);
  // everything after "--" is a path, even names starting with '-'
  args.emplace_back("--");
  args.insert(args.end(), paths.begin(), paths.end());
  return args;
}

int SvnClient::commit(const std::filesystem::path &root, const std::set<std::string> &paths,
                      const std::string &message, const CommitEnv &env) {
  spdlog::info("[svn] committing {} path(s) in {}", paths.size(), root.string());
  const auto res = run_process(commit_args(paths, message, env), root, env.vars, Output::Inherit);
  return res.exit_code;
}

} // namespace shipit
