// app.cpp — option wiring, trace, progress and timing around the simulator

#include "app/app.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <utility>

#include "core/rng.hpp"
#include "grid/render.hpp"
#include "io/progress_bar.hpp"
#include "sim/occupancy_simulator.hpp"
#include "util/timing.hpp"

namespace app {

int run_app(const cli::Options& opt, std::ostream& out) {
    const std::uint64_t seed = opt.seed ? *opt.seed : core::make_random_seed();
    core::SplitMix64 rng(seed);

    RunProgress progress;
    sim::RunHooks hooks;
    hooks.max_attempts = opt.max_attempts;
    if (opt.progress) {
        hooks.progress_every = std::max<core::count_t>(1, opt.iterations / 1000);
        hooks.on_progress = [&](core::count_t done, core::count_t total) { progress.update(done, total); };
    }
    if (opt.trace > 0) {
        std::fprintf(stderr, "seed: %" PRIu64 "\n", seed);
        hooks.trace_iterations = opt.trace;
        hooks.on_trace = [&](core::count_t i, const grid::GridState& g) {
            out << "Iteration: " << i << "\n" << g << "\n";
        };
    }

    sim::OccupancySimulator<core::SplitMix64> simulator(rng, std::move(hooks));

    Stopwatch sw;
    sim::OccupancyPercentages result;
    try {
        if (opt.progress) progress.start();
        result = simulator.run(opt.start_x, opt.start_y, opt.iterations);
        progress.finish();
    } catch (const std::invalid_argument& e) {
        progress.finish();
        std::fprintf(stderr, "ERROR: %s\n", e.what());
        return 2;
    } catch (const std::domain_error& e) {
        progress.finish();
        std::fprintf(stderr, "ERROR: %s\n", e.what());
        return 2;
    } catch (const std::exception& e) {
        progress.finish();
        std::fprintf(stderr, "ERROR: simulation aborted: %s\n", e.what());
        return 1;
    }
    const double elapsed = sw.seconds();

    out << std::setprecision(12) << result << "\n";
    if (opt.time) out << "Executed in " << format_seconds(elapsed) << "\n";
    return 0;
}

} // namespace app
