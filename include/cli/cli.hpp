// cli.hpp — Command-line parsing interface (cxxopts)
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "core/config.hpp"

namespace cli {

struct Options {
    // Starting coordinate of the empty cell (column 0..2, row 0..1)
    std::size_t start_x = 0;
    std::size_t start_y = 0;

    // Accepted-move iterations
    core::count_t iterations = 100'000'000;

    // Fixed seed; nullopt => seed from the entropy source
    std::optional<std::uint64_t> seed;

    // Optional resample cap per iteration; nullopt => ∞ (no cap)
    std::optional<std::size_t> max_attempts;

    bool progress = false;        // terminal progress bar
    core::count_t trace = 0;      // print the board after the first N iterations
    bool time = true;             // print wall-clock time of the run

    std::string config_path;

    // parser result
    int exit_code = 0;
};

// Parse CLI arguments. A --config file is loaded first and supplies
// defaults; options given on the command line override it.
// Returns false when the program should exit with opt.exit_code
// (after --help, or on a parse/validation error already reported on stderr).
bool parse_args(int argc, char** argv, Options& opt);

// Check ranges after config + CLI merge. Reports "ERROR: ..." on stderr.
bool validate(Options& opt);

// Value parsers shared by the CLI and the config file.
bool parse_bool(const std::string& s, bool& v);
bool parse_seed(const std::string& s, std::optional<std::uint64_t>& seed);

} // namespace cli
