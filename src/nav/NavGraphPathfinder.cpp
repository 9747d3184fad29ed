#include "trailnav/nav/NavGraphPathfinder.hpp"
#include "trailnav/nav/PathPostProcess.hpp"
#include "trailnav/nav/RegionGraph.hpp"
#include "trailnav/nav/WeightedAStar.hpp"
#include "trailnav/core/Log.hpp"

#include <string>
#include <utility>

namespace trailnav::nav {

namespace {

void Trace(const NavConfig& cfg, const char* msg) {
    if (cfg.trace)
        logsys::get()->debug(msg);
}

template <class... Args>
void Trace(const NavConfig& cfg, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if (cfg.trace)
        logsys::get()->debug(fmt, std::forward<Args>(args)...);
}

std::string Fmt(const Vec3& p) {
    return fmt::format("({:.1f}, {:.1f}, {:.1f})", p.x, p.y, p.z);
}

} // namespace

// Per-call state. Holds the node snapshot so a concurrent Publish cannot
// change the data under a running query.
struct NavGraphPathfinder::Query {
    std::shared_ptr<const NavNodeSet> nodes;
    Vec3 start{};
    Vec3 goal{};
    PathStats stats{};

    PathResult Finish(PathStatus status, std::vector<Vec3> points = {}) const {
        PathResult r;
        r.status = status;
        if (status == PathStatus::Found) r.points = std::move(points);
        r.stats = stats;
        return r;
    }
};

NavGraphPathfinder::NavGraphPathfinder(const NavNodeStore& nodes,
                                       const IInteriorNavigator& interior,
                                       const IWorldQuery& world,
                                       NavConfig cfg)
    : nodes_(nodes), interior_(interior), world_(world), cfg_(cfg) {
    ClampNavConfig(cfg_);
    Trace(cfg_, "Initialized with {} nodes", nodes_.size());
}

PathResult NavGraphPathfinder::FindPath(const Vec3& start, const Vec3& goal) const {
    Query q{ nodes_.Snapshot(), start, goal };

    if (!InWorld(start) || !InWorld(goal)) {
        Trace(cfg_, "Start or goal is outside the world bounds");
        return q.Finish(PathStatus::NoRoute);
    }
    Trace(cfg_, "Finding path from {} to {}", Fmt(start), Fmt(goal));

    const bool startInside = interior_.IsInsideBuilding(start);
    const bool goalInside  = interior_.IsInsideBuilding(goal);

    if (startInside && goalInside && Distance(start, goal) < cfg_.maxInteriorDistance) {
        Trace(cfg_, "Both points are inside - attempting direct interior path");
        auto p = interior_.FindInteriorPath(start, goal);
        if (!p.empty()) {
            Trace(cfg_, "Found direct interior path ({} points)", p.size());
            return q.Finish(PathStatus::Found, std::move(p));
        }
    }

    if (startInside) return InteriorToExterior(q);
    if (goalInside)  return ExteriorToInterior(q);

    Trace(cfg_, "Both points are exterior - using node graph");
    auto p = ExteriorPath(q, start, goal);
    if (p.empty()) return q.Finish(PathStatus::NoRoute);
    return q.Finish(PathStatus::Found, std::move(p));
}

PathResult NavGraphPathfinder::InteriorToExterior(Query& q) const {
    const auto exits = FindBuildingExits(world_, interior_, q.start, cfg_);
    if (exits.empty()) {
        Trace(cfg_, "No valid building exits found");
        return q.Finish(PathStatus::NoRoute);
    }

    for (const BuildingExit& exit : exits) {
        ++q.stats.candidatesTried;

        auto full = interior_.FindInteriorPath(q.start, exit.position);
        if (full.empty()) continue;

        const auto outside = ExteriorPath(q, exit.position, q.goal);
        if (outside.empty()) continue;

        AppendPath(full, outside);
        Trace(cfg_, "Found valid path through exit {}", Fmt(exit.position));
        return q.Finish(PathStatus::Found, SmoothPath(full, interior_, cfg_));
    }

    Trace(cfg_, "No valid path found through any of {} exits", exits.size());
    return q.Finish(PathStatus::Exhausted);
}

PathResult NavGraphPathfinder::ExteriorToInterior(Query& q) const {
    const auto entrances = FindBuildingExits(world_, interior_, q.goal, cfg_);
    if (entrances.empty()) {
        Trace(cfg_, "No valid building entrances found");
        return q.Finish(PathStatus::NoRoute);
    }

    for (const BuildingExit& entrance : entrances) {
        ++q.stats.candidatesTried;

        auto full = ExteriorPath(q, q.start, entrance.position);
        if (full.empty()) continue;

        const auto inside = interior_.FindInteriorPath(entrance.position, q.goal);
        if (inside.empty()) continue;

        AppendPath(full, inside);
        Trace(cfg_, "Found valid path through entrance {}", Fmt(entrance.position));
        return q.Finish(PathStatus::Found, SmoothPath(full, interior_, cfg_));
    }

    Trace(cfg_, "No valid path found through any of {} entrances", entrances.size());
    return q.Finish(PathStatus::Exhausted);
}

std::vector<Vec3> NavGraphPathfinder::ExteriorPath(Query& q, const Vec3& from, const Vec3& to) const {
    const RegionGraph region = BuildRegionGraph(*q.nodes, from, to, cfg_);
    ++q.stats.regionGraphs;
    q.stats.nodesSelected += static_cast<std::uint32_t>(region.size());

    if (region.empty()) {
        Trace(cfg_, "No nodes found in region (radius {:.1f})", region.radius());
        return {};
    }

    const std::uint32_t s = FindNearestNode(region, from, cfg_);
    const std::uint32_t t = FindNearestNode(region, to, cfg_);
    if (s == kNoNode || t == kNoNode) {
        Trace(cfg_, "Could not find start or goal nodes");
        return {};
    }

    const RegionSearchResult found = FindRegionPath(region, s, t, cfg_);
    q.stats.nodesExpanded += found.expanded;
    if (found.nodes.empty()) {
        Trace(cfg_, "No path found through region ({} nodes, {} edges)", region.size(), region.edgeCount());
        return {};
    }

    return BuildFullPath(from, to, region, found.nodes, interior_, cfg_);
}

} // namespace trailnav::nav
