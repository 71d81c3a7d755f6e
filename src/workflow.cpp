#include "shipit/workflow.hpp"

#include "shipit/consts.hpp"
#include "shipit/errors.hpp"
#include "shipit/oracle.hpp"
#include "shipit/reconcile.hpp"
#include "shipit/util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <istream>
#include <ostream>
#include <utility>

namespace stdfs = std::filesystem;

namespace shipit {

namespace {

std::string revision_label(std::uint64_t id) { return consts::kRevisionPrefix + std::to_string(id); }

bool same_location(const std::string &a, const stdfs::path &b) {
  std::error_code ec1;
  std::error_code ec2;
  const auto ca = stdfs::weakly_canonical(a, ec1);
  const auto cb = stdfs::weakly_canonical(b, ec2);
  if (ec1 || ec2)
    return pathutil::normalize(a) == pathutil::normalize(b.string());
  return pathutil::normalize(ca.string()) == pathutil::normalize(cb.string());
}

} // namespace

RevisionChooser console_chooser(std::istream &in, std::ostream &out) {
  return [&in, &out](const std::vector<RevisionRef> &revisions) -> RevisionRef {
    for (const auto &r : revisions) {
      out << "    " << revision_label(r.id) << "  " << r.name << "\n";
    }
    out << "\nWhich revision do you want to commit? " << std::flush;
    std::string line;
    if (!std::getline(in, line))
      throw AbortError();
    const std::string answer = strutil::trim(line);
    if (answer.empty() && revisions.size() == 1)
      return revisions.front();
    const auto id = parse_revision_id(answer);
    if (!id)
      throw UsageError("'" + answer + "' is not a revision id");
    const auto it = std::ranges::find_if(revisions, [&](const RevisionRef &r) { return r.id == *id; });
    if (it == revisions.end())
      throw UsageError("Revision " + revision_label(*id) + " is not in the list.");
    return *it;
  };
}

CommitWorkflow::CommitWorkflow(const WorkingCopy &wc, ReviewService &review, Vcs &vcs,
                               DecisionPolicy &policy, RevisionChooser choose, std::ostream &out)
    : wc_{wc}, review_{review}, vcs_{vcs}, policy_{policy}, choose_(std::move(choose)),
      out_{out} {}

RevisionRef CommitWorkflow::resolve_revision(const CommitOptions &opts) {
  const auto revisions = review_.find_committable(opts.owner);
  spdlog::debug("[commit] {} committable revision(s) for '{}'", revisions.size(), opts.owner);

  if (opts.revision_id) {
    const auto it = std::ranges::find_if(
        revisions, [&](const RevisionRef &r) { return r.id == *opts.revision_id; });
    if (it == revisions.end()) {
      throw UsageError("Revision " + revision_label(*opts.revision_id) +
                       " is not committable. You can only commit revisions you own which "
                       "have been 'accepted'.");
    }
    return *it;
  }
  if (revisions.empty()) {
    throw UsageError("You have no committable revisions. You can only commit revisions you "
                     "own which have been 'accepted'.");
  }
  return choose_(revisions);
}

std::set<std::string> CommitWorkflow::commit_file_list(const RevisionRef &revision) {
  if (wc_.backend() != Backend::Subversion) {
    throw UsageError("shipit commit is only supported under SVN. Amend and push the change "
                     "with your VCS instead.");
  }

  if (!revision.source_path.empty() && !same_location(revision.source_path, wc_.root())) {
    require_proceed(policy_, Advisory::ForeignWorkingCopy,
                    {revision.source_path, wc_.root().string()});
  }

  const DeclaredPathSet declared = review_.declared_paths(revision.id);
  const WorkingCopyStatus status = vcs_.status(wc_.root());

  const FilesystemOracle disk{wc_.root()};
  const CachingOracle oracle{disk};
  const auto result = reconcile(declared, status, oracle);

  require_proceed(policy_, Advisory::UnincludedModifications, result.unincluded_modifications);
  require_proceed(policy_, Advisory::MissingPaths, result.missing_paths);
  return result.final_paths;
}

int CommitWorkflow::run(const CommitOptions &opts) {
  const RevisionRef revision = resolve_revision(opts);
  const std::string message = review_.commit_message(revision.id);

  if (opts.show) {
    out_ << message;
    if (!message.empty() && message.back() != consts::kLF)
      out_ << consts::kLF;
    return 0;
  }

  out_ << "Committing " << revision_label(revision.id) << " '" << revision.name << "'...\n";

  const auto files = commit_file_list(revision);

  const int rc = vcs_.commit(wc_.root(), files, message, utf8_commit_env());
  if (rc != 0) {
    throw ExternalToolError("Executing 'svn commit' failed!", rc);
  }

  if (!wc_.config().remote_hooks_installed) {
    out_ << "According to " << consts::kProjectConfig
         << ", remote commit hooks are not installed for this project, so the revision will be "
            "marked committed now.\n\n";
    review_.mark_committed(revision.id);
    out_ << "Marked " << revision_label(revision.id) << " committed.\n";
  }
  return 0;
}

} // namespace shipit
