#pragma once
// app.hpp — run one simulation from parsed options and print the result

#include <ostream>

#include "cli/cli.hpp"

namespace app {

// Prints the six "In <label>: <value>" lines to `out`, then
// "Executed in <t>" when opt.time is set. Diagnostics go to stderr.
// Returns a process exit code: 0 ok, 2 bad configuration, 1 runtime failure.
int run_app(const cli::Options& opt, std::ostream& out);

} // namespace app
