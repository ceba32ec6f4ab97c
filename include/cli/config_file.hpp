// config_file.hpp — key=value run configuration
#pragma once

#include <istream>
#include <string>

#include "cli/cli.hpp"

namespace cli {

// Recognised keys (case-insensitive):
//   start_x, start_y, iterations, seed, max_attempts, progress, trace, time
// '#' and ';' start a comment. Unknown keys and bad values are reported as
// WARN lines on stderr and skipped.
//
// Returns false only if the file cannot be opened.
bool load_config(const std::string& path, Options& o);

// Same, reading from an already open stream.
void load_config(std::istream& in, Options& o);

} // namespace cli
