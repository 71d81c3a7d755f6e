#pragma once

namespace shipit::cli {

// Handlers get argv with the subcommand name at argv[0].
using command_fn = int (*)(int argc, char **argv);

} // namespace shipit::cli
