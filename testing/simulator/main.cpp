// simulator tests
// Direction mapping, the resample loop, and whole runs of
// sim::OccupancySimulator with deterministic engines.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

#include "core/rng.hpp"
#include "grid/grid_state.hpp"
#include "sim/direction.hpp"
#include "sim/occupancy_simulator.hpp"
#include "sim/simulate.hpp"
#include "sim/tally.hpp"

using grid::Direction;
using grid::GridState;
using grid::Position;

namespace testutil {

inline std::mt19937_64 make_rng(std::uint64_t seed = 0x51DE5EEDULL) {
    return std::mt19937_64{seed};
}

// Replays a fixed list of words, cycling. Counts how many were drawn.
struct ScriptedRng {
    using result_type = std::uint64_t;
    std::vector<std::uint64_t> words;
    std::size_t next{0};
    std::size_t drawn{0};

    static constexpr result_type min() { return 0; }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }
    result_type operator()() {
        ++drawn;
        const auto w = words[next];
        next = (next + 1) % words.size();
        return w;
    }
};

// Words whose unit double lands in the middle of each quarter.
constexpr std::uint64_t kUp    = 0x2000000000000000ULL; // 0.125
constexpr std::uint64_t kDown  = 0x6000000000000000ULL; // 0.375
constexpr std::uint64_t kLeft  = 0xA000000000000000ULL; // 0.625
constexpr std::uint64_t kRight = 0xE000000000000000ULL; // 0.875

} // namespace testutil

TEST_CASE("Unit draws map to directions by quarter") {
    CHECK(sim::direction_from_unit(0.0)    == Direction::Up);
    CHECK(sim::direction_from_unit(0.2499) == Direction::Up);
    CHECK(sim::direction_from_unit(0.25)   == Direction::Down);
    CHECK(sim::direction_from_unit(0.4999) == Direction::Down);
    CHECK(sim::direction_from_unit(0.5)    == Direction::Left);
    CHECK(sim::direction_from_unit(0.7499) == Direction::Left);
    CHECK(sim::direction_from_unit(0.75)   == Direction::Right);
    CHECK(sim::direction_from_unit(0.9999) == Direction::Right);
}

TEST_CASE("unit_double stays in [0,1)") {
    testutil::ScriptedRng rng{{0ULL, std::numeric_limits<std::uint64_t>::max()}};
    CHECK(core::unit_double(rng) == 0.0);
    const double top = core::unit_double(rng);
    CHECK(top < 1.0);
    CHECK(top > 0.999999);
}

TEST_CASE("Rejected draws are resampled until a move is accepted") {
    GridState g(0, 0);
    // up and left are illegal at (0,0); the third draw (right) is accepted
    testutil::ScriptedRng rng{{testutil::kUp, testutil::kLeft, testutil::kRight}};
    const auto draws = sim::step_until_accepted(g, rng);
    CHECK(draws == 3);
    CHECK(rng.drawn == 3);
    CHECK(g.current_position() == Position{1, 0});
}

TEST_CASE("An attempt cap turns an endless rejection streak into an error") {
    GridState g(0, 0);
    testutil::ScriptedRng rng{{testutil::kUp}};
    CHECK_THROWS_AS(sim::step_until_accepted(g, rng, std::size_t{16}), std::runtime_error);
    CHECK(rng.drawn == 16);
    CHECK(g.current_position() == Position{0, 0});
}

TEST_CASE("Scripted walk produces the expected tally") {
    // (0,0) -down-> (0,1) -right-> (1,1) -up-> (1,0) -down-> (1,1)
    testutil::ScriptedRng rng{{testutil::kDown, testutil::kRight, testutil::kUp, testutil::kDown}};
    sim::OccupancySimulator<testutil::ScriptedRng> simulator(rng);
    auto t = simulator.run_tally(0, 0, 4);
    CHECK(t.iterations() == 4);
    CHECK(t.draws() == 4);
    CHECK(t.count(Position{0, 1}) == 1);
    CHECK(t.count(Position{1, 1}) == 2);
    CHECK(t.count(Position{1, 0}) == 1);
}

TEST_CASE("Invalid start fails before any random draw") {
    testutil::ScriptedRng rng{{testutil::kDown}};
    sim::OccupancySimulator<testutil::ScriptedRng> simulator(rng);
    CHECK_THROWS_AS(simulator.run_tally(3, 0, 10), std::invalid_argument);
    CHECK_THROWS_AS(simulator.run(0, 2, 10), std::invalid_argument);
    CHECK(rng.drawn == 0);
}

TEST_CASE("Zero iterations give an empty tally and no percentages") {
    auto rng = testutil::make_rng();
    sim::OccupancySimulator<std::mt19937_64> simulator(rng);
    auto t = simulator.run_tally(1, 1, 0);
    CHECK(t.iterations() == 0);
    CHECK(t.total() == 0);
    CHECK_THROWS_AS(simulator.run(1, 1, 0), std::domain_error);
}

TEST_CASE("Counters sum to n and percentages to one from every start") {
    for (std::size_t y = 0; y < GridState::rows; ++y) {
        for (std::size_t x = 0; x < GridState::cols; ++x) {
            CAPTURE(x); CAPTURE(y);
            auto rng = testutil::make_rng(0x1000 + y * 3 + x);
            sim::OccupancySimulator<std::mt19937_64> simulator(rng);
            const sim::count_t n = 10007;
            auto t = simulator.run_tally(x, y, n);
            CHECK(t.total() == n);
            CHECK(t.iterations() == n);
            CHECK(t.draws() >= n);

            auto p = t.percentages();
            for (std::size_t i = 0; i < sim::num_positions; ++i) {
                CHECK(p[i] >= 0.0);
                CHECK(p[i] <= 1.0);
            }
            CHECK(p.sum() == doctest::Approx(1.0).epsilon(1e-9));
        }
    }
}

TEST_CASE("Same seed, same tally") {
    auto rng_a = testutil::make_rng(42);
    auto rng_b = testutil::make_rng(42);
    sim::OccupancySimulator<std::mt19937_64> sa(rng_a), sb(rng_b);
    auto a = sa.run_tally(2, 1, 50000);
    auto b = sb.run_tally(2, 1, 50000);
    CHECK(a.counts() == b.counts());
    CHECK(a.draws() == b.draws());

    const auto pa = sim::simulate_seeded(0, 0, 20000, 7);
    const auto pb = sim::simulate_seeded(0, 0, 20000, 7);
    CHECK(pa.value == pb.value);
}

TEST_CASE("Hooks observe the run without changing it") {
    auto rng_plain = testutil::make_rng(9);
    auto rng_hooked = testutil::make_rng(9);

    std::vector<Position> traced;
    std::vector<sim::count_t> progress;
    sim::RunHooks hooks;
    hooks.trace_iterations = 5;
    hooks.on_trace = [&](sim::count_t, const GridState& g) { traced.push_back(g.current_position()); };
    hooks.progress_every = 250;
    hooks.on_progress = [&](sim::count_t done, sim::count_t total) {
        CHECK(total == 1000);
        progress.push_back(done);
    };

    sim::OccupancySimulator<std::mt19937_64> plain(rng_plain);
    sim::OccupancySimulator<std::mt19937_64> hooked(rng_hooked, hooks);
    auto a = plain.run_tally(0, 0, 1000);
    auto b = hooked.run_tally(0, 0, 1000);

    CHECK(a.counts() == b.counts());
    CHECK(traced.size() == 5);
    REQUIRE(progress.size() == 5);
    CHECK(progress.front() == 250);
    CHECK(progress.back() == 1000);
}

TEST_CASE("Long runs are symmetric across the board") {
    auto rng = testutil::make_rng(0xFEEDULL);
    sim::OccupancySimulator<std::mt19937_64> simulator(rng);
    const auto p = simulator.run(0, 0, 2'000'000);

    const double corners[] = {p[0], p[2], p[3], p[5]};
    for (double c : corners) {
        CHECK(c == doctest::Approx(p[0]).epsilon(0.05));
        // accepted moves are uniform over legal neighbours, so visits
        // follow the number of legal moves: 2 of 14 for each corner
        CHECK(c == doctest::Approx(1.0 / 7.0).epsilon(0.05));
    }
    CHECK(p[1] == doctest::Approx(p[4]).epsilon(0.05));
    CHECK(p[1] == doctest::Approx(3.0 / 14.0).epsilon(0.05));
}

TEST_CASE("Entropy-seeded entry point returns a distribution") {
    const auto p = sim::simulate(1, 0, 10000);
    CHECK(p.sum() == doctest::Approx(1.0).epsilon(1e-9));
}
