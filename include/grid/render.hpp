// render.hpp — text view of the board for traces
#pragma once

#include <ostream>
#include <string>

#include "grid/grid_state.hpp"

namespace grid {

// One line per row, "[ ]" for the empty cell and "[.]" for a particle,
// followed by "Empty spot position: (x, y)".
std::string render(const GridState& g);

std::ostream& operator<<(std::ostream& os, const GridState& g);

} // namespace grid
