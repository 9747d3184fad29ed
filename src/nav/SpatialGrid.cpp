#include "trailnav/nav/SpatialGrid.hpp"
#include "trailnav/nav/NavTypes.hpp"

namespace trailnav::nav {

SpatialGrid::SpatialGrid(std::int32_t cellSize)
    : cell_(cellSize < 1 ? 1 : cellSize) {}

CellKey SpatialGrid::KeyFor(double x, double z) const noexcept {
    const double s = static_cast<double>(cell_);
    return { FloorToCell(x / s), FloorToCell(z / s) };
}

void SpatialGrid::Insert(std::uint32_t id, double x, double z) {
    cells_[KeyFor(x, z)].push_back(id);
}

const std::vector<std::uint32_t>* SpatialGrid::Cell(const CellKey& k) const {
    auto it = cells_.find(k);
    return it == cells_.end() ? nullptr : &it->second;
}

} // namespace trailnav::nav
