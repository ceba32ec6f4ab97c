// occupancy_simulator.hpp — n accepted-move iterations of the empty cell
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>

#include "core/config.hpp"
#include "core/rng.hpp"
#include "grid/grid_state.hpp"
#include "sim/direction.hpp"
#include "sim/tally.hpp"

namespace sim {

/**
 * @brief Optional observers for a run. None of them alter the walk.
 */
struct RunHooks {
    // Called with (done, total) every `progress_every` iterations and once at the end.
    std::function<void(count_t, count_t)> on_progress;
    count_t progress_every{0};

    // Called with the board after each of the first `trace_iterations` iterations.
    std::function<void(count_t, const grid::GridState&)> on_trace;
    count_t trace_iterations{0};

    // Resample cap per iteration; nullopt => unlimited.
    std::optional<std::size_t> max_attempts;
};

/**
 * @brief Random-walk driver over one GridState and one OccupancyTally.
 * @tparam Rng 64-bit engine; held by reference so callers choose seeding.
 */
template <core::Urbg64 Rng>
class OccupancySimulator {
public:
    /**
     * @brief Bind the generator used by every run of this simulator.
     * @param rng Generator; must outlive the simulator.
     */
    explicit OccupancySimulator(Rng& rng, RunHooks hooks = {})
        : rng_(rng), hooks_(std::move(hooks)) {}

    /**
     * @brief Walk n accepted moves from (start_x, start_y) and count visits.
     * @throws std::invalid_argument for an off-board start, before any draw.
     */
    OccupancyTally run_tally(std::size_t start_x, std::size_t start_y, count_t n) {
        grid::GridState board(start_x, start_y);
        OccupancyTally tally;

        for (count_t i = 0; i < n; ++i) {
            tally.add_draws(step_until_accepted(board, rng_, hooks_.max_attempts));
            tally.record(board.current_position());

            if (i < hooks_.trace_iterations && hooks_.on_trace) hooks_.on_trace(i + 1, board);
            if (hooks_.progress_every && hooks_.on_progress && (i + 1) % hooks_.progress_every == 0)
                hooks_.on_progress(i + 1, n);
        }
        if (hooks_.on_progress) hooks_.on_progress(n, n);
        return tally;
    }

    /**
     * @brief run_tally() converted to relative frequencies.
     * @throws std::domain_error when n == 0.
     */
    OccupancyPercentages run(std::size_t start_x, std::size_t start_y, count_t n) {
        return run_tally(start_x, start_y, n).percentages();
    }

private:
    Rng& rng_;
    RunHooks hooks_;
};

} // namespace sim
