#pragma once
// rng.hpp — seedable generator, entropy seeding and unit-interval draws.

#include <chrono>
#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <limits>
#include <random>
#include <thread>

namespace core {

// Any engine producing full-width 64-bit words. The unit draw below relies
// on all 64 bits being random.
template <class URBG>
concept Urbg64 = std::uniform_random_bit_generator<URBG> &&
    URBG::min() == 0 &&
    URBG::max() == std::numeric_limits<std::uint64_t>::max();

inline std::uint64_t mix64(std::uint64_t z) {
    z += 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

// SplitMix64: fast, 64-bit state, satisfies std::uniform_random_bit_generator.
struct SplitMix64 {
    using result_type = std::uint64_t;
    std::uint64_t state;

    explicit SplitMix64(std::uint64_t seed = 0x9E3779B97F4A7C15ULL) : state(seed) {}

    static constexpr result_type min() { return std::numeric_limits<result_type>::min(); }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    inline std::uint64_t next_u64() {
        std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }
    inline result_type operator()() { return next_u64(); }
};

// Uniform double in [0, 1) from the top 53 bits (53-bit mantissa).
template <Urbg64 URBG>
inline double unit_double(URBG& rng) {
    return (rng() >> 11) * (1.0 / (1ull << 53));
}

// Seed from the OS entropy source, mixed with clock and thread id so a
// platform whose random_device is deterministic (or throws) still yields
// distinct seeds per process.
inline std::uint64_t make_random_seed() {
    std::uint64_t s = 0;
    try {
        std::random_device rd;
        const std::uint64_t a = (std::uint64_t(rd()) << 32) ^ std::uint64_t(rd());
        s ^= mix64(a);
    } catch (const std::exception&) {
        // No entropy device; the clock and thread id below still vary.
    }
    const auto t = static_cast<std::uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    s ^= mix64(t);
    const auto tid = static_cast<std::uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    s ^= mix64(tid);
    if (s == 0) s = 0x9E3779B97F4A7C15ULL;
    return s;
}

} // namespace core
