#pragma once
#include <cstdint>
#include <vector>
#include "IInteriorNavigator.hpp"
#include "IWorldQuery.hpp"
#include "NavConfig.hpp"
#include "NavTypes.hpp"

namespace trailnav::nav {

// Walks the perimeter of the (2r+1) x (2r+1) square centred on the origin,
// x-major then z, without touching the inside of the square. r == 0 yields the
// single centre cell.
class ShellIterator {
public:
    explicit ShellIterator(std::int32_t radius) noexcept
        : r_(radius < 0 ? 0 : radius), x_(-r_), z_(-r_) {}

    bool Next(std::int32_t& dx, std::int32_t& dz) noexcept;

    [[nodiscard]] std::int32_t radius() const noexcept { return r_; }
    [[nodiscard]] std::uint32_t size() const noexcept {
        return r_ == 0 ? 1u : static_cast<std::uint32_t>(8 * r_);
    }

private:
    std::int32_t r_;
    std::int32_t x_, z_;
};

// Candidate point where a route may cross between interior and exterior space.
struct BuildingExit {
    BlockPos block{};
    Vec3 position{};
    double clearance = 0.0;
    bool hasValidApproach = false;
};

// Standable cell with at least one N/S/E/W neighbour on the other side of the
// inside/outside boundary.
[[nodiscard]] bool IsTransitionCell(const IWorldQuery& world, const IInteriorNavigator& interior,
                                    const BlockPos& p);

// Sum of 1/distance over the 5x5 ring around `p` (centre excluded) for every
// cell with headroom.
[[nodiscard]] double MeasureClearance(const IWorldQuery& world, const BlockPos& p);

// The cell two steps toward the first exterior-side cardinal neighbour must be
// standable. False when every neighbour is inside.
[[nodiscard]] bool HasExteriorApproach(const IWorldQuery& world, const IInteriorNavigator& interior,
                                       const BlockPos& p);

// Expanding ring search around `reference` for exits (or entrances, the test is
// symmetric). Stops at the first ring that yields anything; returns at most
// cfg.maxExitCandidates ordered by distance / clearance.
[[nodiscard]] std::vector<BuildingExit> FindBuildingExits(const IWorldQuery& world,
                                                          const IInteriorNavigator& interior,
                                                          const Vec3& reference,
                                                          const NavConfig& cfg);

} // namespace trailnav::nav
