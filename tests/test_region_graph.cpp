#include <doctest/doctest.h>
#include "trailnav/nav/RegionGraph.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

using namespace trailnav::nav;

namespace trailnav_region_graph_test {

NavNodeSet LineOfNodes(int count, double spacing, double cost) {
    NavNodeSet nodes;
    for (int i = 0; i < count; ++i)
        nodes.push_back({ i * spacing, 64.0, 0.0, cost });
    return nodes;
}

} // namespace trailnav_region_graph_test

using namespace trailnav_region_graph_test;

TEST_CASE("RegionGraph/RadiusHasFloorAndGrowsWithDistance") {
    const NavConfig cfg;
    CHECK(RegionRadius({ 0, 64, 0 }, { 10, 64, 0 }, cfg) == doctest::Approx(200.0));
    CHECK(RegionRadius({ 0, 64, 0 }, { 1000, 64, 0 }, cfg) == doctest::Approx(750.0));
}

TEST_CASE("RegionGraph/SelectionIsMonotoneInRadius") {
    NavNodeSet nodes;
    for (int i = 0; i < 60; ++i)
        nodes.push_back({ i * 7.0 - 200.0, 64.0, (i % 5) * 13.0, 20.0 });

    NavConfig small;
    small.searchRadius = 50.0;
    NavConfig large = small;
    large.searchRadius = 120.0;

    const Vec3 s{ -10, 64, 0 }, g{ 10, 64, 0 };
    const auto a = SelectRegionNodes(nodes, s, g, small);
    const auto b = SelectRegionNodes(nodes, s, g, large);

    CHECK(a.size() < b.size());
    for (std::uint32_t id : a)
        CHECK(std::find(b.begin(), b.end(), id) != b.end());
}

TEST_CASE("RegionGraph/EdgeCostUsesMaxAndRoadDiscount") {
    const NavConfig cfg;
    CHECK(EdgeCost({ 0, 0, 0, 50 }, { 0, 0, 0, 80 }, cfg) == doctest::Approx(80.0));
    CHECK(EdgeCost({ 0, 0, 0, 10 }, { 0, 0, 0, 50 }, cfg) == doctest::Approx(5.0));
    CHECK(EdgeCost({ 0, 0, 0, 15 }, { 0, 0, 0, 15 }, cfg) == doctest::Approx(1.5));
}

TEST_CASE("RegionGraph/EdgesAreSymmetricAndWithinRange") {
    NavNodeSet nodes;
    for (int x = 0; x < 8; ++x)
        for (int z = 0; z < 8; ++z)
            nodes.push_back({ x * 4.0, 64.0 + (x + z) % 3, z * 4.0, 20.0 + x });

    const NavConfig cfg;
    const RegionGraph g = BuildRegionGraph(nodes, { 0, 64, 0 }, { 28, 64, 28 }, cfg);
    REQUIRE(g.size() == nodes.size());
    CHECK(g.edgeCount() > 0);

    for (std::uint32_t i = 0; i < g.size(); ++i) {
        for (const RegionEdge& e : g.edges(i)) {
            CHECK(e.target != i);
            CHECK(Distance(g.node(i).node.pos(), g.node(e.target).node.pos()) <= cfg.connectionRange + 1e-9);
            CHECK(e.cost == doctest::Approx(EdgeCost(g.node(i).node, g.node(e.target).node, cfg)));

            const auto back = g.edges(e.target);
            const bool mirrored = std::any_of(back.begin(), back.end(),
                                              [&](const RegionEdge& r) { return r.target == i; });
            CHECK(mirrored);
        }
    }
}

TEST_CASE("RegionGraph/NodesOutsideRadiusAreLeftOut") {
    NavNodeSet nodes = LineOfNodes(3, 5.0, 20.0);
    nodes.push_back({ 5000.0, 64.0, 0.0, 20.0 });

    const RegionGraph g = BuildRegionGraph(nodes, { 0, 64, 0 }, { 10, 64, 0 }, NavConfig{});
    CHECK(g.size() == 3);
    CHECK(g.radius() == doctest::Approx(200.0));
    CHECK(g.center() == Vec3{ 5, 64, 0 });
}

TEST_CASE("RegionGraph/EmptyWhenNothingInRange") {
    const RegionGraph g = BuildRegionGraph(LineOfNodes(4, 5.0, 20.0), { 9000, 64, 0 }, { 9010, 64, 0 }, NavConfig{});
    CHECK(g.empty());
    CHECK(FindNearestNode(g, { 9000, 64, 0 }, NavConfig{}) == kNoNode);
}

TEST_CASE("RegionGraph/NearestNodePrefersRoads") {
    NavNodeSet nodes{
        { 2.0, 64.0, 0.0, 100.0 }, // off-road, 2 away: score 4
        { 0.0, 64.0, 3.0, 10.0 },  // road, 3 away: score 9 * 0.25
    };
    const NavConfig cfg;
    const RegionGraph g = BuildRegionGraph(nodes, { 0, 64, 0 }, { 1, 64, 0 }, cfg);
    REQUIRE(g.size() == 2);
    CHECK(FindNearestNode(g, { 0, 64, 0 }, cfg) == 1);

    NavConfig noBias = cfg;
    noBias.roadNearestWeight = 1.0;
    CHECK(FindNearestNode(g, { 0, 64, 0 }, noBias) == 0);
}

TEST_CASE("RegionGraph/NearestNodeIgnoresHeightAndKeepsFirstOnTie") {
    NavNodeSet nodes{
        { 1.0, 90.0, 0.0, 100.0 },
        { -1.0, 64.0, 0.0, 100.0 },
    };
    const NavConfig cfg;
    const RegionGraph g = BuildRegionGraph(nodes, { 0, 64, 0 }, { 0, 64, 1 }, cfg);
    REQUIRE(g.size() == 2);
    CHECK(FindNearestNode(g, { 0, 64, 0 }, cfg) == 0);
}
