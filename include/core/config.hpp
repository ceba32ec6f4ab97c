// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>

// Compile-time configuration for core facilities.
//
// The board is fixed at 2 rows x 3 columns. The dimensions live here so
// that every module agrees on them, not so they can be changed.

namespace core {
inline constexpr std::size_t grid_cols = 3;
inline constexpr std::size_t grid_rows = 2;
inline constexpr std::size_t grid_cells = grid_cols * grid_rows;
}

// Global hardening switch for optional runtime assertions in debug/testing code.
// Set via compile flag: -DGRIDWALK_HARDENED=1
#ifndef GRIDWALK_HARDENED
#define GRIDWALK_HARDENED 0
#endif

#if GRIDWALK_HARDENED
#include <stdexcept>
#define GRIDWALK_ASSERT_H(cond, msg) do { if(!(cond)) throw std::runtime_error(msg); } while(0)
#else
#define GRIDWALK_ASSERT_H(cond, msg) do { } while(0)
#endif

// Counter type for tallies and iteration counts. 64-bit by default so the
// reference run (1e8 iterations) and merged tallies never overflow.
#ifndef GRIDWALK_COUNT_T
#define GRIDWALK_COUNT_T std::uint64_t
#endif

namespace core {
using count_t = GRIDWALK_COUNT_T;
using size_t  = std::size_t;
}
