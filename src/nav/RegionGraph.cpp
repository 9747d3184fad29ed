#include "trailnav/nav/RegionGraph.hpp"
#include "trailnav/nav/SpatialGrid.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace trailnav::nav {

double RegionRadius(const Vec3& start, const Vec3& goal, const NavConfig& cfg) noexcept {
    return std::max(cfg.searchRadius, Distance(start, goal) * 0.75);
}

std::vector<std::uint32_t> SelectRegionNodes(const NavNodeSet& all,
                                             const Vec3& start, const Vec3& goal,
                                             const NavConfig& cfg) {
    const Vec3 mid = Midpoint(start, goal);
    const double r = RegionRadius(start, goal, cfg);
    const double r2 = r * r;

    std::vector<std::uint32_t> picked;
    for (std::size_t i = 0; i < all.size(); ++i) {
        if (DistanceSq(all[i].pos(), mid) <= r2)
            picked.push_back(static_cast<std::uint32_t>(i));
    }
    return picked;
}

double EdgeCost(const NavNode& a, const NavNode& b, const NavConfig& cfg) noexcept {
    double c = std::max(a.cost, b.cost);
    if (cfg.IsRoad(a.cost) || cfg.IsRoad(b.cost))
        c *= cfg.roadEdgeDiscount;
    return c;
}

RegionGraph BuildRegionGraph(const NavNodeSet& all,
                             const Vec3& start, const Vec3& goal,
                             const NavConfig& cfg) {
    RegionGraph g;
    g.center_ = Midpoint(start, goal);
    g.radius_ = RegionRadius(start, goal, cfg);

    const auto picked = SelectRegionNodes(all, start, goal, cfg);
    if (picked.empty()) return g;

    g.nodes_.reserve(picked.size());
    for (std::uint32_t src : picked)
        g.nodes_.push_back(RegionNode{ all[src] });

    SpatialGrid grid(static_cast<std::int32_t>(std::ceil(cfg.connectionRange)));
    for (std::uint32_t i = 0; i < g.nodes_.size(); ++i)
        grid.Insert(i, g.nodes_[i].node.x, g.nodes_[i].node.z);

    const double range2 = cfg.connectionRange * cfg.connectionRange;
    g.edges_.reserve(g.nodes_.size() * 8);

    for (std::uint32_t i = 0; i < g.nodes_.size(); ++i) {
        RegionNode& rn = g.nodes_[i];
        const NavNode& a = rn.node;
        rn.firstEdge = static_cast<std::uint32_t>(g.edges_.size());

        grid.ForEachNear(a.x, a.z, [&](std::uint32_t j) {
            if (j == i) return;
            const NavNode& b = g.nodes_[j].node;
            if (DistanceSq(a.pos(), b.pos()) <= range2)
                g.edges_.push_back({ j, EdgeCost(a, b, cfg) });
        });

        rn.edgeCount = static_cast<std::uint32_t>(g.edges_.size()) - rn.firstEdge;
    }
    return g;
}

std::uint32_t FindNearestNode(const RegionGraph& g, const Vec3& p, const NavConfig& cfg) noexcept {
    std::uint32_t best = kNoNode;
    double bestScore = std::numeric_limits<double>::max();

    for (std::uint32_t i = 0; i < g.size(); ++i) {
        const NavNode& n = g.node(i).node;
        const double dx = n.x - p.x;
        const double dz = n.z - p.z;
        double score = dx * dx + dz * dz;
        if (cfg.IsRoad(n.cost)) score *= cfg.roadNearestWeight;
        if (score < bestScore) {
            bestScore = score;
            best = i;
        }
    }
    return best;
}

} // namespace trailnav::nav
