#include "shipit/errors.hpp"
#include "shipit/reconcile.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using shipit::DeclaredPathSet;
using shipit::WorkingCopyStatus;

namespace {

// Oracle over an in-memory picture of the disk.
class FakeOracle : public shipit::ExistenceOracle {
public:
  std::set<std::string> present;
  std::set<std::string> links; // symlinks, possibly dangling

  bool exists(const std::string &p) const override { return present.contains(p); }
  bool is_symlink(const std::string &p) const override { return links.contains(p); }
};

void check(bool cond, const std::string &what) {
  if (!cond)
    throw std::runtime_error(what);
}

bool subset_of(const std::set<std::string> &a, const DeclaredPathSet &b) {
  return std::ranges::includes(b, a);
}

void scenario_a_unincluded_modification() {
  const DeclaredPathSet declared{"a.txt", "b.txt"};
  const WorkingCopyStatus status{{"a.txt", shipit::kFlagModified},
                                 {"b.txt", shipit::kFlagModified},
                                 {"c.txt", shipit::kFlagModified}};
  FakeOracle disk;
  disk.present = {"a.txt", "b.txt", "c.txt"};

  const auto r = shipit::reconcile(declared, status, disk);
  check(r.unincluded_modifications == std::vector<std::string>{"c.txt"},
        "A: expected c.txt as the only unincluded modification");
  check(r.missing_paths.empty(), "A: nothing should be missing");
  check(r.final_paths == std::set<std::string>{"a.txt", "b.txt"}, "A: final paths");
  check(r.conflicts.empty(), "A: no conflicts");
}

void scenario_b_directory_conflict() {
  const DeclaredPathSet declared{"dir/"};
  const WorkingCopyStatus status{{"dir/x.txt", shipit::kFlagModified}};
  FakeOracle disk;
  disk.present = {"dir", "dir/x.txt"};

  try {
    (void)shipit::reconcile(declared, status, disk);
  } catch (const shipit::ConflictError &e) {
    check(e.directory() == "dir/", "B: conflict should name dir/");
    check(e.path() == "dir/x.txt", "B: conflict should name dir/x.txt");
    const std::string msg = e.what();
    check(msg.find("'dir/'") != std::string::npos && msg.find("'dir/x.txt'") != std::string::npos,
          "B: message should quote both paths");
    return;
  }
  throw std::runtime_error("B: expected ConflictError");
}

void scenario_c_only_path_missing() {
  const DeclaredPathSet declared{"gone.txt"};
  const FakeOracle disk;
  bool threw = false;
  try {
    (void)shipit::reconcile(declared, {}, disk);
  } catch (const shipit::EmptyCommitError &e) {
    threw = true;
    check(e.missing_paths() == std::vector<std::string>{"gone.txt"}, "C: gone.txt named");
  }
  check(threw, "C: expected EmptyCommitError");
}

void empty_commit_names_every_missing_path() {
  const DeclaredPathSet declared{"gone1.txt", "gone2.txt"};
  const FakeOracle disk;
  bool threw = false;
  try {
    (void)shipit::reconcile(declared, {}, disk);
  } catch (const shipit::EmptyCommitError &e) {
    threw = true;
    check(e.missing_paths() == std::vector<std::string>{"gone1.txt", "gone2.txt"},
          "both missing paths carried");
    const std::string what = e.what();
    check(what.find("gone1.txt") != std::string::npos &&
              what.find("gone2.txt") != std::string::npos,
          "message lists the missing paths");
  }
  check(threw, "expected EmptyCommitError");
}

void scenario_d_deleted_path_kept() {
  const DeclaredPathSet declared{"del.txt"};
  const WorkingCopyStatus status{{"del.txt", shipit::kFlagDeleted}};
  const FakeOracle disk;

  const auto r = shipit::reconcile(declared, status, disk);
  check(r.final_paths == std::set<std::string>{"del.txt"}, "D: del.txt kept");
  check(r.missing_paths.empty(), "D: no missing warning");
  check(r.unincluded_modifications.empty(), "D: no unincluded warning");
}

void missing_path_dropped_others_kept() {
  const DeclaredPathSet declared{"keep.txt", "gone.txt"};
  FakeOracle disk;
  disk.present = {"keep.txt"};

  const auto r = shipit::reconcile(declared, {{"keep.txt", shipit::kFlagModified}}, disk);
  check(r.missing_paths == std::vector<std::string>{"gone.txt"}, "gone.txt reported missing");
  check(r.final_paths == std::set<std::string>{"keep.txt"}, "gone.txt dropped");
  check(subset_of(r.final_paths, declared), "final paths must be declared");
}

void dangling_symlink_kept() {
  const DeclaredPathSet declared{"link"};
  FakeOracle disk;
  disk.links = {"link"}; // target does not exist, so exists() says no

  const auto r = shipit::reconcile(declared, {}, disk);
  check(r.final_paths == std::set<std::string>{"link"}, "symlink kept");
  check(r.missing_paths.empty(), "symlink not missing");
}

void conflict_wins_over_everything() {
  // missing paths, unincluded edits and an empty result would all follow,
  // but the conflict is reported first
  const DeclaredPathSet declared{"src", "gone.txt"};
  const WorkingCopyStatus status{{"other.txt", shipit::kFlagModified},
                                 {"src/deep/new.c", shipit::kFlagUnversioned}};
  const FakeOracle disk;
  bool threw = false;
  try {
    (void)shipit::reconcile(declared, status, disk);
  } catch (const shipit::ConflictError &e) {
    threw = e.directory() == "src" && e.path() == "src/deep/new.c";
  }
  check(threw, "conflict must take precedence");
}

void sibling_prefix_is_not_a_descendant() {
  const DeclaredPathSet declared{"dir"};
  const WorkingCopyStatus status{{"dirx/a.txt", shipit::kFlagModified},
                                 {"dir", shipit::kFlagModified}};
  FakeOracle disk;
  disk.present = {"dir", "dirx", "dirx/a.txt"};

  const auto r = shipit::reconcile(declared, status, disk);
  check(r.unincluded_modifications == std::vector<std::string>{"dirx/a.txt"},
        "dirx/a.txt is outside dir");
  check(r.final_paths == std::set<std::string>{"dir"}, "dir kept");
}

void declared_descendants_are_fine() {
  const DeclaredPathSet declared{"dir", "dir/x.txt"};
  const WorkingCopyStatus status{{"dir", shipit::kFlagAdded}, {"dir/x.txt", shipit::kFlagAdded}};
  FakeOracle disk;
  disk.present = {"dir", "dir/x.txt"};

  const auto r = shipit::reconcile(declared, status, disk);
  check(r.final_paths.size() == 2, "both kept");
  check(r.unincluded_modifications.empty(), "nothing unincluded");
}

void trailing_slash_matches_status_entry() {
  const DeclaredPathSet declared{"olddir/"};
  const WorkingCopyStatus status{{"olddir", shipit::kFlagDeleted}};
  const FakeOracle disk;

  const auto r = shipit::reconcile(declared, status, disk);
  check(r.final_paths == std::set<std::string>{"olddir/"}, "deleted dir kept as declared");
  check(r.unincluded_modifications.empty(), "olddir is declared, not unincluded");
}

} // namespace

int main() {
  try {
    scenario_a_unincluded_modification();
    scenario_b_directory_conflict();
    scenario_c_only_path_missing();
    empty_commit_names_every_missing_path();
    scenario_d_deleted_path_kept();
    missing_path_dropped_others_kept();
    dangling_symlink_kept();
    conflict_wins_over_everything();
    sibling_prefix_is_not_a_descendant();
    declared_descendants_are_fine();
    trailing_slash_matches_status_entry();
  } catch (const std::exception &e) {
    std::cerr << "reconcile: " << e.what() << "\n";
    return 1;
  }
  std::cout << "reconcile OK\n";
  return 0;
}
