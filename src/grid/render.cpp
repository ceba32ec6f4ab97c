// render.cpp

#include "grid/render.hpp"

namespace grid {

std::string render(const GridState& g) {
    std::string out;
    out.reserve(GridState::rows * (GridState::cols * 3 + 1) + 32);
    for (std::size_t y = 0; y < GridState::rows; ++y) {
        for (std::size_t x = 0; x < GridState::cols; ++x)
            out += g.is_empty(x, y) ? "[ ]" : "[.]";
        out += '\n';
    }
    const Position p = g.current_position();
    out += "Empty spot position: (" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
    return out;
}

std::ostream& operator<<(std::ostream& os, const GridState& g) {
    return os << render(g);
}

} // namespace grid
