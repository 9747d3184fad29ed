#include <doctest/doctest.h>
#include "trailnav/nav/ExitFinder.hpp"
#include "test_support/FakeWorld.hpp"

#include <algorithm>
#include <cstdlib>
#include <set>
#include <utility>
#include <vector>

using namespace trailnav::nav;
using namespace trailnav_test_support;

TEST_CASE("ShellIterator/RadiusZeroYieldsCentreOnly") {
    ShellIterator it(0);
    std::int32_t dx = 9, dz = 9;
    REQUIRE(it.Next(dx, dz));
    CHECK(dx == 0);
    CHECK(dz == 0);
    CHECK_FALSE(it.Next(dx, dz));
    CHECK(it.size() == 1u);
}

TEST_CASE("ShellIterator/RadiusOneOrder") {
    ShellIterator it(1);
    std::vector<std::pair<int, int>> cells;
    std::int32_t dx = 0, dz = 0;
    while (it.Next(dx, dz)) cells.emplace_back(dx, dz);

    const std::vector<std::pair<int, int>> expected{
        { -1, -1 }, { -1, 0 }, { -1, 1 },
        { 0, -1 }, { 0, 1 },
        { 1, -1 }, { 1, 0 }, { 1, 1 },
    };
    CHECK(cells == expected);
}

TEST_CASE("ShellIterator/VisitsPerimeterExactlyOnce") {
    for (std::int32_t r = 1; r <= 6; ++r) {
        ShellIterator it(r);
        std::set<std::pair<int, int>> seen;
        std::int32_t dx = 0, dz = 0;
        std::uint32_t n = 0;
        while (it.Next(dx, dz)) {
            CHECK(std::max(std::abs(dx), std::abs(dz)) == r);
            seen.emplace(dx, dz);
            ++n;
        }
        CHECK(n == it.size());
        CHECK(seen.size() == static_cast<std::size_t>(8 * r));
    }
}

TEST_CASE("ExitFinder/TransitionCells") {
    VoxelWorld world;
    BuildHouse(world);
    const BoxInterior interior({ kHouse });

    CHECK(IsTransitionCell(world, interior, kDoor));
    CHECK_FALSE(IsTransitionCell(world, interior, { 5, 64, 5 }));  // middle of the room
    CHECK_FALSE(IsTransitionCell(world, interior, { 5, 64, 30 })); // open field
    CHECK_FALSE(IsTransitionCell(world, interior, { 5, 66, 11 })); // floating, nothing below
    CHECK_FALSE(IsTransitionCell(world, interior, { 4, 64, 10 })); // wall
}

TEST_CASE("ExitFinder/ClearanceDropsNextToWalls") {
    VoxelWorld world;
    const double open = MeasureClearance(world, { 50, 64, 50 });
    CHECK(open > 10.0);

    BuildHouse(world);
    const double door = MeasureClearance(world, kDoor);
    CHECK(door > 2.0);
    CHECK(door < open);

    VoxelWorld buried(100);
    CHECK(MeasureClearance(buried, { 0, 64, 0 }) == 0.0);
}

TEST_CASE("ExitFinder/ApproachNeedsStandableCellOutside") {
    VoxelWorld world;
    BuildHouse(world);
    const BoxInterior interior({ kHouse });
    CHECK(HasExteriorApproach(world, interior, kDoor));

    world.Carve({ 5, 63, 12 }); // hole where the approach would land
    CHECK_FALSE(HasExteriorApproach(world, interior, kDoor));

    BoxInterior everywhere;
    everywhere.everywhere = true;
    CHECK_FALSE(HasExteriorApproach(world, everywhere, kDoor));
}

TEST_CASE("ExitFinder/FindsTheDoor") {
    VoxelWorld world;
    BuildHouse(world);
    const BoxInterior interior({ kHouse });

    const auto exits = FindBuildingExits(world, interior, { 5, 64, 5 }, NavConfig{});
    REQUIRE(exits.size() == 1);
    CHECK(exits[0].block == kDoor);
    CHECK(exits[0].position == kDoor.to_vec());
    CHECK(exits[0].hasValidApproach);
    CHECK(exits[0].clearance > 2.0);
}

TEST_CASE("ExitFinder/SealedHouseFallsBackToOuterRingRanked") {
    VoxelWorld world;
    BuildHouse(world, /*withDoor*/ false);
    const BoxInterior interior({ kHouse });
    const Vec3 ref{ 5, 64, 5 };

    const NavConfig cfg;
    const auto exits = FindBuildingExits(world, interior, ref, cfg);
    REQUIRE(exits.size() == static_cast<std::size_t>(cfg.maxExitCandidates));

    for (std::size_t i = 0; i < exits.size(); ++i) {
        const BlockPos& b = exits[i].block;
        CHECK(std::max(std::abs(b.x - 5), std::abs(b.z - 5)) == 6);
        CHECK_FALSE(interior.IsInsideBuilding(exits[i].position));
        if (i > 0) {
            CHECK(Distance(exits[i - 1].position, ref) / exits[i - 1].clearance
                  <= Distance(exits[i].position, ref) / exits[i].clearance);
        }
    }
}

TEST_CASE("ExitFinder/NothingWhenEverythingIsInside") {
    VoxelWorld world;
    BoxInterior interior;
    interior.everywhere = true;

    NavConfig cfg;
    cfg.exitSearchRange = 8;
    CHECK(FindBuildingExits(world, interior, { 0, 64, 0 }, cfg).empty());
}

TEST_CASE("ExitFinder/CandidateCountIsConfigurable") {
    VoxelWorld world;
    BuildHouse(world, false);
    const BoxInterior interior({ kHouse });

    NavConfig cfg;
    cfg.maxExitCandidates = 1;
    CHECK(FindBuildingExits(world, interior, { 5, 64, 5 }, cfg).size() == 1);
}
