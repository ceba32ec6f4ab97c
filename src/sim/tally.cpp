// tally.cpp

#include "sim/tally.hpp"

#include <numeric>
#include <sstream>
#include <stdexcept>

namespace sim {

namespace {
constexpr const char* kLabels[num_positions] = {"zero", "one", "two", "three", "four", "five"};
}

const char* position_label(std::size_t index) {
    if (index >= num_positions) throw std::out_of_range("position index out of range");
    return kLabels[index];
}

std::size_t position_index(grid::Position p) {
    if (p.x >= core::grid_cols || p.y >= core::grid_rows) {
        std::ostringstream os;
        os << "empty cell reached non-canonical position (" << p.x << ", " << p.y << ")";
        throw std::logic_error(os.str());
    }
    return p.y * core::grid_cols + p.x;
}

double OccupancyPercentages::sum() const {
    return std::accumulate(value.begin(), value.end(), 0.0);
}

std::ostream& operator<<(std::ostream& os, const OccupancyPercentages& p) {
    for (std::size_t i = 0; i < num_positions; ++i) {
        os << "In " << kLabels[i] << ": " << p.value[i];
        if (i + 1 < num_positions) os << '\n';
    }
    return os;
}

void OccupancyTally::record(grid::Position p) {
    ++counts_[position_index(p)];
    ++iterations_;
    GRIDWALK_ASSERT_H(total() == iterations_, "tally counters do not sum to iterations");
}

void OccupancyTally::merge(const OccupancyTally& other) noexcept {
    for (std::size_t i = 0; i < num_positions; ++i) counts_[i] += other.counts_[i];
    iterations_ += other.iterations_;
    draws_ += other.draws_;
}

count_t OccupancyTally::total() const noexcept {
    return std::accumulate(counts_.begin(), counts_.end(), count_t{0});
}

OccupancyPercentages OccupancyTally::percentages() const {
    if (iterations_ == 0) throw std::domain_error("percentages undefined for an empty tally");
    OccupancyPercentages out;
    const double n = static_cast<double>(iterations_);
    for (std::size_t i = 0; i < num_positions; ++i)
        out.value[i] = static_cast<double>(counts_[i]) / n;
    return out;
}

} // namespace sim
