// simulate.hpp — production entry point with an entropy-seeded generator
#pragma once

#include <cstddef>
#include <cstdint>

#include "sim/tally.hpp"

namespace sim {

// Seeds core::SplitMix64 from core::make_random_seed() and runs
// OccupancySimulator::run. Throws as OccupancySimulator does.
OccupancyPercentages simulate(std::size_t start_x, std::size_t start_y, count_t n);

// Same with a fixed seed, for reproducible runs.
OccupancyPercentages simulate_seeded(std::size_t start_x, std::size_t start_y, count_t n,
                                     std::uint64_t seed);

} // namespace sim
