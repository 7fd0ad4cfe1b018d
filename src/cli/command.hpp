#pragma once

namespace gitgate::cli {

// Subcommand entry point; receives argv starting at the subcommand name.
using command_fn = int (*)(int argc, char **argv);

} // namespace gitgate::cli
