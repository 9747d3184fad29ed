#pragma once
#include <vector>
#include "NavTypes.hpp"

namespace trailnav::nav {

// Resolves movement inside building interiors. Owned by the caller; the
// pathfinder only consumes it and calls it from whatever thread runs FindPath,
// so implementations must be safe for concurrent const calls.
struct IInteriorNavigator {
    virtual ~IInteriorNavigator() = default;

    virtual bool IsInsideBuilding(const Vec3& p) const = 0;

    // Ordered start..goal points, or empty when no interior route exists.
    virtual std::vector<Vec3> FindInteriorPath(const Vec3& start, const Vec3& goal) const = 0;
};

} // namespace trailnav::nav
