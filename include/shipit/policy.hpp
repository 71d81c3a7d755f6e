#pragma once
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace shipit {

// Warnings the operator may choose to override.
enum class Advisory : std::uint8_t {
  ForeignWorkingCopy,      // revision was built in a different working copy
  UnincludedModifications, // local changes the revision leaves out
  MissingPaths,            // declared paths that no longer exist
};

enum class Decision : std::uint8_t { Proceed, Abort };

// yes/no question; true means yes
using ConfirmFn = std::function<bool(std::string_view prompt)>;

class DecisionPolicy {
public:
  virtual ~DecisionPolicy() = default;
  [[nodiscard]] virtual Decision decide(Advisory category,
                                        const std::vector<std::string> &paths) = 0;
};

// Renders each warning to `out` and asks `confirm`.
class ConfirmPolicy : public DecisionPolicy {
public:
  ConfirmPolicy(ConfirmFn confirm, std::ostream &out);

  [[nodiscard]] Decision decide(Advisory category,
                                const std::vector<std::string> &paths) override;

private:
  ConfirmFn confirm_;
  std::ostream &out_;
};

struct WarningText {
  std::string prefix;     // printed above the path list
  std::string prompt;     // the question
  bool list_paths = true; // false when prefix already names them
};

// Message wording for a category; singular when exactly one path is given.
[[nodiscard]] WarningText warning_text(Advisory category, const std::vector<std::string> &paths);

// Ask `policy` about a non-empty category; throws AbortError on Abort.
void require_proceed(DecisionPolicy &policy, Advisory category,
                     const std::vector<std::string> &paths);

// Reads y/n from `in` after writing the prompt to `out`. Anything else,
// including end of input, counts as no.
[[nodiscard]] ConfirmFn console_confirm(std::istream &in, std::ostream &out);

} // namespace shipit
