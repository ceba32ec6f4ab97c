// tally.hpp — per-position visit counters and their relative frequencies
#pragma once

#include <array>
#include <cstddef>
#include <ostream>

#include "core/config.hpp"
#include "grid/grid_state.hpp"

namespace sim {

using count_t = core::count_t;

// Row-major labels:
//   [zero ][one ][two ]
//   [three][four][five]
inline constexpr std::size_t num_positions = core::grid_cells;

const char* position_label(std::size_t index);

/**
 * @brief Row-major index of a canonical position.
 * @throws std::logic_error for a coordinate outside the 2x3 board.
 */
std::size_t position_index(grid::Position p);

/**
 * @brief Relative visit frequencies, one per position, in label order.
 */
struct OccupancyPercentages {
    std::array<double, num_positions> value{};

    double operator[](std::size_t i) const { return value[i]; }
    double sum() const;
};

// Six lines "In <label>: <value>".
std::ostream& operator<<(std::ostream& os, const OccupancyPercentages& p);

/**
 * @brief Visit counters for one run (or several merged runs).
 *
 * Invariant: the counters sum to `iterations`.
 */
class OccupancyTally {
public:
    OccupancyTally() = default;

    void record(grid::Position p);
    void add_draws(count_t n) noexcept { draws_ += n; }

    // Sum counters of an independent tally into this one.
    void merge(const OccupancyTally& other) noexcept;

    count_t iterations() const noexcept { return iterations_; }
    count_t draws() const noexcept { return draws_; }
    count_t count(std::size_t index) const { return counts_.at(index); }
    count_t count(grid::Position p) const { return counts_[position_index(p)]; }
    const std::array<count_t, num_positions>& counts() const noexcept { return counts_; }
    count_t total() const noexcept;

    /**
     * @brief Divide each counter by the iteration count.
     * @throws std::domain_error when no iteration has been recorded.
     */
    OccupancyPercentages percentages() const;

private:
    std::array<count_t, num_positions> counts_{};
    count_t iterations_{0};
    count_t draws_{0};
};

} // namespace sim
