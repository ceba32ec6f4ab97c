// simulate.cpp

#include "sim/simulate.hpp"

#include "core/rng.hpp"
#include "sim/occupancy_simulator.hpp"

namespace sim {

OccupancyPercentages simulate(std::size_t start_x, std::size_t start_y, count_t n) {
    return simulate_seeded(start_x, start_y, n, core::make_random_seed());
}

OccupancyPercentages simulate_seeded(std::size_t start_x, std::size_t start_y, count_t n,
                                     std::uint64_t seed) {
    core::SplitMix64 rng(seed);
    OccupancySimulator<core::SplitMix64> simulator(rng);
    return simulator.run(start_x, start_y, n);
}

} // namespace sim
