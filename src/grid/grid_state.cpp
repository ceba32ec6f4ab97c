// grid_state.cpp — bounds-checked moves of the empty cell

#include "grid/grid_state.hpp"

#include <sstream>
#include <stdexcept>

namespace grid {

std::string IllegalMove::describe() const {
    std::ostringstream os;
    os << "Move not possible: (" << from_x << ", " << from_y << ") -> ("
       << to_x << ", " << to_y << ")";
    return os.str();
}

const char* direction_name(Direction d) noexcept {
    switch (d) {
        case Direction::Up:    return "up";
        case Direction::Down:  return "down";
        case Direction::Left:  return "left";
        case Direction::Right: return "right";
    }
    return "?";
}

GridState::GridState(std::size_t start_x, std::size_t start_y)
    : empty_x_(start_x), empty_y_(start_y) {
    if (start_x >= cols || start_y >= rows) {
        std::ostringstream os;
        os << "start position (" << start_x << ", " << start_y
           << ") is outside the " << rows << "x" << cols << " grid";
        throw std::invalid_argument(os.str());
    }
}

IllegalMove GridState::rejected(int dx, int dy) const noexcept {
    const int x = static_cast<int>(empty_x_);
    const int y = static_cast<int>(empty_y_);
    return IllegalMove{x, y, x + dx, y + dy};
}

MoveError GridState::move_up() {
    if (empty_y_ == 0) return rejected(0, -1);
    empty_y_ = 0;
    return std::nullopt;
}

MoveError GridState::move_down() {
    if (empty_y_ == rows - 1) return rejected(0, +1);
    empty_y_ = rows - 1;
    return std::nullopt;
}

MoveError GridState::move_left() {
    if (empty_x_ == 0) return rejected(-1, 0);
    --empty_x_;
    return std::nullopt;
}

MoveError GridState::move_right() {
    if (empty_x_ == cols - 1) return rejected(+1, 0);
    ++empty_x_;
    return std::nullopt;
}

MoveError GridState::move(Direction d) {
    switch (d) {
        case Direction::Up:    return move_up();
        case Direction::Down:  return move_down();
        case Direction::Left:  return move_left();
        case Direction::Right: return move_right();
    }
    throw std::logic_error("unknown direction");
}

} // namespace grid
