#include "shipit/status.hpp"

#include <iostream>
#include <string>

int main() {
  const std::string out = "M       a.txt\n"
                          "A  +    copied/b.txt\n"
                          "D       old.txt\n"
                          "?       scratch.log\n"
                          "!       lost.c\n"
                          " M      props-only\n"
                          "R       replaced.h\n"
                          "I       ignored.o\n"
                          "      C tree/conflict.c\n"
                          "      >   local edit, incoming delete upon update\n"
                          "\n"
                          "Performing status on external item at 'ext':\n"
                          "X       ext\n"
                          "M       spaced name.txt\r\n";

  const auto st = shipit::parse_svn_status(out);

  auto expect = [&](const std::string &path, shipit::StatusMask mask) {
    const auto got = shipit::flags_for(st, path);
    if (got != mask) {
      std::cerr << "flags for '" << path << "': got " << shipit::describe_flags(got)
                << " want " << shipit::describe_flags(mask) << "\n";
      return false;
    }
    return true;
  };

  bool ok = true;
  ok &= expect("a.txt", shipit::kFlagModified);
  ok &= expect("copied/b.txt", shipit::kFlagAdded);
  ok &= expect("old.txt", shipit::kFlagDeleted);
  ok &= expect("scratch.log", shipit::kFlagUnversioned);
  ok &= expect("lost.c", shipit::kFlagMissing);
  ok &= expect("props-only", shipit::kFlagProperty);
  ok &= expect("replaced.h", shipit::kFlagAdded | shipit::kFlagDeleted);
  ok &= expect("tree/conflict.c", shipit::kFlagConflicted);
  ok &= expect("ext", shipit::kFlagExternals);
  ok &= expect("spaced name.txt", shipit::kFlagModified);

  if (st.contains("ignored.o")) {
    std::cerr << "ignored entries must not be reported\n";
    ok = false;
  }
  if (st.size() != 10) {
    std::cerr << "expected 10 entries, got " << st.size() << "\n";
    ok = false;
  }
  if (shipit::describe_flags(shipit::kFlagModified | shipit::kFlagConflicted) != "MC") {
    std::cerr << "describe_flags mismatch\n";
    ok = false;
  }
  if (!shipit::parse_svn_status("").empty()) {
    std::cerr << "empty output must parse to empty status\n";
    ok = false;
  }

  if (!ok)
    return 1;
  std::cout << "svn status parse OK\n";
  return 0;
}
