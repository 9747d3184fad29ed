#include "trailnav/nav/ExitFinder.hpp"

#include <algorithm>
#include <cmath>

namespace trailnav::nav {

bool ShellIterator::Next(std::int32_t& dx, std::int32_t& dz) noexcept {
    if (x_ > r_) return false;
    dx = x_;
    dz = z_;

    if (r_ == 0) {
        x_ = 1; // done after the centre
        return true;
    }

    const bool edgeColumn = (x_ == -r_ || x_ == r_);
    if (edgeColumn && z_ < r_) {
        ++z_;
    } else if (!edgeColumn && z_ == -r_) {
        z_ = r_; // jump over the inside of the square
    } else {
        ++x_;
        z_ = -r_;
    }
    return true;
}

bool IsTransitionCell(const IWorldQuery& world, const IInteriorNavigator& interior, const BlockPos& p) {
    if (!CanStandAt(world, p)) return false;

    const bool inside = interior.IsInsideBuilding(p.to_vec());
    for (const BlockPos& d : kCardinals) {
        if (interior.IsInsideBuilding(p.offset(d.x, 0, d.z).to_vec()) != inside)
            return true;
    }
    return false;
}

double MeasureClearance(const IWorldQuery& world, const BlockPos& p) {
    double clearance = 0.0;
    for (std::int32_t x = -2; x <= 2; ++x) {
        for (std::int32_t z = -2; z <= 2; ++z) {
            if (x == 0 && z == 0) continue;
            if (HasHeadroom(world, p.offset(x, 0, z)))
                clearance += 1.0 / std::sqrt(static_cast<double>(x * x + z * z));
        }
    }
    return clearance;
}

bool HasExteriorApproach(const IWorldQuery& world, const IInteriorNavigator& interior, const BlockPos& p) {
    for (const BlockPos& d : kCardinals) {
        if (interior.IsInsideBuilding(p.offset(d.x, 0, d.z).to_vec())) continue;
        return CanStandAt(world, p.offset(d.x * 2, 0, d.z * 2));
    }
    return false;
}

std::vector<BuildingExit> FindBuildingExits(const IWorldQuery& world,
                                            const IInteriorNavigator& interior,
                                            const Vec3& reference,
                                            const NavConfig& cfg) {
    std::vector<BuildingExit> exits;
    const BlockPos origin = BlockPos::from_vec(reference);
    const std::int32_t vscan = cfg.exitVerticalScan;

    for (std::int32_t r = 1; r <= cfg.exitSearchRange; ++r) {
        ShellIterator shell(r);
        std::int32_t dx = 0, dz = 0;
        while (shell.Next(dx, dz)) {
            for (std::int32_t dy = -vscan; dy <= vscan; ++dy) {
                const BlockPos cell = origin.offset(dx, dy, dz);
                if (!IsTransitionCell(world, interior, cell)) continue;

                const double clearance = MeasureClearance(world, cell);
                if (clearance <= cfg.minExitClearance) continue;
                if (!HasExteriorApproach(world, interior, cell)) continue;

                exits.push_back({ cell, cell.to_vec(), clearance, true });
            }
        }

        if (!exits.empty()) {
            std::stable_sort(exits.begin(), exits.end(), [&](const BuildingExit& a, const BuildingExit& b) {
                return Distance(a.position, reference) / a.clearance
                     < Distance(b.position, reference) / b.clearance;
            });
            if (exits.size() > static_cast<std::size_t>(cfg.maxExitCandidates))
                exits.resize(static_cast<std::size_t>(cfg.maxExitCandidates));
            return exits;
        }
    }
    return exits;
}

} // namespace trailnav::nav
