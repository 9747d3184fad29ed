#include "trailnav/nav/WeightedAStar.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>

namespace trailnav::nav {

namespace {

struct OpenRec {
    double f;
    std::uint32_t id;
};

// Min-heap on f; equal f pops the lower id so results are reproducible.
struct FSort {
    bool operator()(const OpenRec& a, const OpenRec& b) const noexcept {
        if (a.f != b.f) return a.f > b.f;
        return a.id > b.id;
    }
};

std::vector<std::uint32_t> Reconstruct(std::uint32_t start, std::uint32_t goal,
                                       const std::vector<std::uint32_t>& parent) {
    std::vector<std::uint32_t> out;
    for (std::uint32_t cur = goal; cur != kNoNode; cur = parent[cur]) {
        out.push_back(cur);
        if (cur == start) break;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace

double VerticalPenalty(double dy, const NavConfig& cfg) noexcept {
    const double a = std::abs(dy);
    return a > cfg.verticalDiffThreshold ? (a - cfg.verticalDiffThreshold) * cfg.verticalPenalty : 0.0;
}

double ExpansionCost(const NavNode& from, const NavNode& to, const NavConfig& cfg) noexcept {
    double cost = to.cost;
    if (cost > cfg.cheapNodeThreshold)
        cost *= cfg.expensiveNodeMultiplier;
    if (cfg.IsRoad(from.cost) && !cfg.IsRoad(to.cost))
        cost *= cfg.offRoadMultiplier;
    return cost + VerticalPenalty(from.y - to.y, cfg);
}

double Heuristic(const NavNode& a, const NavNode& b, const NavConfig& cfg) noexcept {
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    const double dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz + 2.0 * dy * dy) + VerticalPenalty(dy, cfg);
}

RegionSearchResult FindRegionPath(const RegionGraph& g,
                                  std::uint32_t start, std::uint32_t goal,
                                  const NavConfig& cfg) {
    RegionSearchResult res;
    const std::size_t n = g.size();
    if (start >= n || goal >= n) return res;

    constexpr double kInf = std::numeric_limits<double>::infinity();
    std::vector<double> gScore(n, kInf);
    std::vector<std::uint32_t> parent(n, kNoNode);
    std::vector<std::uint8_t> closed(n, 0);

    const NavNode& goalNode = g.node(goal).node;

    std::priority_queue<OpenRec, std::vector<OpenRec>, FSort> open;
    gScore[start] = 0.0;
    open.push({ Heuristic(g.node(start).node, goalNode, cfg), start });

    while (!open.empty()) {
        const OpenRec cur = open.top();
        open.pop();
        if (closed[cur.id]) continue; // stale entry
        closed[cur.id] = 1;
        ++res.expanded;

        if (cur.id == goal) {
            res.nodes = Reconstruct(start, goal, parent);
            return res;
        }

        const NavNode& from = g.node(cur.id).node;
        for (const RegionEdge& e : g.edges(cur.id)) {
            if (closed[e.target]) continue;
            const NavNode& to = g.node(e.target).node;
            const double tentative = gScore[cur.id] + ExpansionCost(from, to, cfg);
            if (tentative < gScore[e.target]) {
                gScore[e.target] = tentative;
                parent[e.target] = cur.id;
                open.push({ tentative + Heuristic(to, goalNode, cfg), e.target });
            }
        }
    }
    return res;
}

} // namespace trailnav::nav
