#pragma once
#include "NavTypes.hpp"

namespace trailnav::nav {

// Adapter to the block world. Implement it over your chunk/voxel storage.
// Only the two queries below are needed by exit discovery.
struct IWorldQuery {
    virtual ~IWorldQuery() = default;

    // Whether an entity's body can occupy the cell (air and similar).
    virtual bool IsPassable(const BlockPos& p) const = 0;

    // Whether the cell can support an entity standing on top of it.
    virtual bool IsSolid(const BlockPos& p) const = 0;
};

// Cell and the one above are free, and the one below carries weight.
inline bool CanStandAt(const IWorldQuery& w, const BlockPos& p) {
    return w.IsPassable(p) && w.IsPassable(p.up()) && w.IsSolid(p.down());
}

inline bool HasHeadroom(const IWorldQuery& w, const BlockPos& p) {
    return w.IsPassable(p) && w.IsPassable(p.up());
}

} // namespace trailnav::nav
