#pragma once
#include <cstdint>
#include <vector>
#include "NavConfig.hpp"
#include "RegionGraph.hpp"

namespace trailnav::nav {

// Extra cost once an elevation change exceeds verticalDiffThreshold.
[[nodiscard]] double VerticalPenalty(double dy, const NavConfig& cfg) noexcept;

// g-cost of stepping from `from` to `to`.
//   to.cost, x expensiveNodeMultiplier above cheapNodeThreshold,
//   x offRoadMultiplier when leaving a road for a non-road node,
//   + VerticalPenalty(dy).
[[nodiscard]] double ExpansionCost(const NavNode& from, const NavNode& to, const NavConfig& cfg) noexcept;

// sqrt(dx^2 + dz^2 + 2 dy^2) + VerticalPenalty(dy).
// NOT admissible: it can overestimate, which keeps routes off steep climbs at
// the price of optimality.
[[nodiscard]] double Heuristic(const NavNode& a, const NavNode& b, const NavConfig& cfg) noexcept;

struct RegionSearchResult {
    std::vector<std::uint32_t> nodes; // start..goal indices into the graph; empty = no path
    std::uint32_t expanded = 0;
};

// Weighted A* over the region graph. Edges define adjacency; step costs come
// from ExpansionCost rather than the stored edge weights.
[[nodiscard]] RegionSearchResult FindRegionPath(const RegionGraph& g,
                                                std::uint32_t start, std::uint32_t goal,
                                                const NavConfig& cfg);

} // namespace trailnav::nav
