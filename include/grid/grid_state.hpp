// grid_state.hpp — the 2x3 board tracked through its single empty cell
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "core/config.hpp"

namespace grid {

/**
 * @brief Coordinate of a cell; x is the column (0..2), y the row (0..1).
 */
struct Position {
    std::size_t x{0};
    std::size_t y{0};

    friend bool operator==(const Position&, const Position&) = default;
};

/**
 * @brief Rejected move: where the empty cell is and where it tried to go.
 *
 * Destination coordinates are signed since they may be -1.
 */
struct IllegalMove {
    int from_x;
    int from_y;
    int to_x;
    int to_y;

    std::string describe() const;
};

// Empty optional means the move was applied.
using MoveError = std::optional<IllegalMove>;

enum class Direction { Up, Down, Left, Right };

const char* direction_name(Direction d) noexcept;

/**
 * @brief Board whose cells all hold identical particles except one.
 *
 * Only the empty cell's coordinate is stored; a move swaps the empty cell
 * with the neighbouring particle, so it is the same as moving the empty
 * coordinate. Up and down are row flips since the board has two rows.
 */
class GridState {
public:
    /**
     * @brief Place the empty cell at (start_x, start_y).
     * @throws std::invalid_argument if the coordinate is off the board.
     */
    GridState(std::size_t start_x, std::size_t start_y);

    [[nodiscard]] MoveError move_up();
    [[nodiscard]] MoveError move_down();
    [[nodiscard]] MoveError move_left();
    [[nodiscard]] MoveError move_right();
    [[nodiscard]] MoveError move(Direction d);

    Position current_position() const noexcept { return {empty_x_, empty_y_}; }
    bool is_empty(std::size_t x, std::size_t y) const noexcept {
        return x == empty_x_ && y == empty_y_;
    }

    static constexpr std::size_t cols = core::grid_cols;
    static constexpr std::size_t rows = core::grid_rows;

private:
    IllegalMove rejected(int dx, int dy) const noexcept;

    std::size_t empty_x_;
    std::size_t empty_y_;
};

} // namespace grid
