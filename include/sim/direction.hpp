// direction.hpp — uniform direction sampling with rejection at the walls
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/config.hpp"
#include "core/rng.hpp"
#include "grid/grid_state.hpp"

namespace sim {

// [0,1) split into quarters in the fixed order up, down, left, right.
inline grid::Direction direction_from_unit(double v) noexcept {
    if (v < 0.25) return grid::Direction::Up;
    if (v < 0.50) return grid::Direction::Down;
    if (v < 0.75) return grid::Direction::Left;
    return grid::Direction::Right;
}

/*
 * One accepted-move iteration: draw a direction, try it, and on an illegal
 * move discard it and draw again. Returns the number of draws consumed
 * (>= 1). At most two of the four directions are blocked on a 2x3 board so
 * the loop ends almost surely; max_attempts == nullopt means no cap.
 */
template <core::Urbg64 URBG>
inline core::count_t step_until_accepted(grid::GridState& g, URBG& rng,
                                         std::optional<std::size_t> max_attempts = std::nullopt) {
    core::count_t draws = 0;
    for (;;) {
        if (max_attempts && draws >= *max_attempts) {
            throw std::runtime_error("no legal move after " + std::to_string(draws) + " draws");
        }
        ++draws;
        if (!g.move(direction_from_unit(core::unit_double(rng)))) return draws;
    }
}

} // namespace sim
