#pragma once
#include <memory>
#include <vector>
#include "ExitFinder.hpp"
#include "IInteriorNavigator.hpp"
#include "IWorldQuery.hpp"
#include "NavConfig.hpp"
#include "NavNodeStore.hpp"
#include "NavTypes.hpp"

namespace trailnav::nav {

// Routes between two world points over the sparse nav node set, handing the
// indoor legs to an IInteriorNavigator.
//
//   both inside and close  -> interior path (falls through if it fails)
//   start inside           -> interior(start, exit) ++ exterior(exit, goal)
//   goal inside            -> exterior(start, entrance) ++ interior(entrance, goal)
//   both outside           -> exterior(start, goal)
//
// FindPath is const and keeps all search state on the stack of the call, so
// one instance can serve any number of threads. The collaborators must outlive
// the pathfinder.
class NavGraphPathfinder {
public:
    NavGraphPathfinder(const NavNodeStore& nodes,
                       const IInteriorNavigator& interior,
                       const IWorldQuery& world,
                       NavConfig cfg = {});

    [[nodiscard]] PathResult FindPath(const Vec3& start, const Vec3& goal) const;

    [[nodiscard]] const NavConfig& config() const noexcept { return cfg_; }

private:
    struct Query;

    PathResult InteriorToExterior(Query& q) const;
    PathResult ExteriorToInterior(Query& q) const;

    // Region graph + weighted A* + assembly. Empty on failure.
    std::vector<Vec3> ExteriorPath(Query& q, const Vec3& from, const Vec3& to) const;

    const NavNodeStore& nodes_;
    const IInteriorNavigator& interior_;
    const IWorldQuery& world_;
    NavConfig cfg_;
};

} // namespace trailnav::nav
