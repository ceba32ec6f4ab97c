// cli.cpp — Command-line parsing implementation using cxxopts

#include "cli/cli.hpp"
#include "cli/config_file.hpp"

#include <cxxopts.hpp>
#include <cctype>
#include <charconv>
#include <iostream>
#include <string>

namespace cli {

bool parse_bool(const std::string& s, bool& v) {
    std::string t; t.reserve(s.size());
    for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (t=="1"||t=="true"||t=="yes"||t=="y"||t=="on")  { v = true;  return true; }
    if (t=="0"||t=="false"||t=="no" ||t=="n"||t=="off"){ v = false; return true; }
    return false;
}

bool parse_seed(const std::string& s, std::optional<std::uint64_t>& seed) {
    if (s == "auto") { seed.reset(); return true; }
    std::uint64_t v = 0;
    const char* b = s.data();
    const char* e = b + s.size();
    auto res = std::from_chars(b, e, v);
    if (res.ec != std::errc{} || res.ptr != e) return false;
    seed = v;
    return true;
}

bool validate(Options& opt) {
    if (opt.start_x >= core::grid_cols) {
        std::cerr << "ERROR: --start-x must be in [0," << core::grid_cols - 1 << "]\n";
        opt.exit_code = 2; return false;
    }
    if (opt.start_y >= core::grid_rows) {
        std::cerr << "ERROR: --start-y must be in [0," << core::grid_rows - 1 << "]\n";
        opt.exit_code = 2; return false;
    }
    if (opt.iterations == 0) {
        std::cerr << "ERROR: --iterations must be > 0\n";
        opt.exit_code = 2; return false;
    }
    if (opt.max_attempts && *opt.max_attempts == 0) {
        std::cerr << "ERROR: --max-attempts must be > 0\n";
        opt.exit_code = 2; return false;
    }
    opt.exit_code = 0;
    return true;
}

bool parse_args(int argc, char** argv, Options& opt) {
    cxxopts::Options desc("gridwalk", "Occupancy of the empty cell on a 2x3 sliding grid (Monte Carlo)");
    desc.add_options()
        ("h,help", "Show this help")
        ("c,config", "key=value file with defaults (CLI overrides)", cxxopts::value<std::string>())
        ("x,start-x", "Starting column of the empty cell (0..2, default 0)", cxxopts::value<std::size_t>())
        ("y,start-y", "Starting row of the empty cell (0..1, default 0)", cxxopts::value<std::size_t>())
        ("n,iterations", "Accepted moves to simulate (default 100000000)", cxxopts::value<core::count_t>())
        ("s,seed", "auto|<u64> (default auto)", cxxopts::value<std::string>())
        ("m,max-attempts", "Resample cap per move (default ∞)", cxxopts::value<std::size_t>())
        ("progress", "Show a progress bar")
        ("trace", "Print the board after each of the first N moves", cxxopts::value<core::count_t>())
        ("time", "on|off: print elapsed time (default on)", cxxopts::value<std::string>())
    ;

    try {
        auto result = desc.parse(argc, argv);
        if (result.count("help")) {
            std::cout << desc.help();
            opt.exit_code = 0;
            return false;
        }

        if (result.count("config")) {
            opt.config_path = result["config"].as<std::string>();
            if (!load_config(opt.config_path, opt)) {
                std::cerr << "ERROR: failed to load config file: " << opt.config_path << "\n";
                opt.exit_code = 2;
                return false;
            }
        }

        if (result.count("start-x"))      opt.start_x = result["start-x"].as<std::size_t>();
        if (result.count("start-y"))      opt.start_y = result["start-y"].as<std::size_t>();
        if (result.count("iterations"))   opt.iterations = result["iterations"].as<core::count_t>();
        if (result.count("max-attempts")) opt.max_attempts = result["max-attempts"].as<std::size_t>();
        if (result.count("progress"))     opt.progress = result["progress"].as<bool>();
        if (result.count("trace"))        opt.trace = result["trace"].as<core::count_t>();
        if (result.count("seed")) {
            const auto s = result["seed"].as<std::string>();
            if (!parse_seed(s, opt.seed)) {
                std::cerr << "ERROR: --seed must be 'auto' or an unsigned integer\n";
                opt.exit_code = 2;
                return false;
            }
        }
        if (result.count("time")) {
            bool b = true;
            if (!parse_bool(result["time"].as<std::string>(), b)) {
                std::cerr << "ERROR: --time must be on or off\n";
                opt.exit_code = 2;
                return false;
            }
            opt.time = b;
        }
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        opt.exit_code = 2;
        return false;
    }

    return validate(opt);
}

} // namespace cli
