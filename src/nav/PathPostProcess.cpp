#include "trailnav/nav/PathPostProcess.hpp"

#include <algorithm>
#include <cmath>

namespace trailnav::nav {

namespace {

// Upper bound on interpolated points per gap; keeps a bogus far-away endpoint
// from allocating millions of waypoints.
constexpr int kMaxGapSteps = 1 << 16;

double ClampStep(double desired, double prev, double maxStep) noexcept {
    const double d = desired - prev;
    if (std::abs(d) > maxStep)
        return prev + std::copysign(maxStep, d);
    return desired;
}

int StepsFor(double amount, double unit) noexcept {
    const double s = std::ceil(amount / unit);
    if (!(s >= 1.0)) return 1;
    if (s >= static_cast<double>(kMaxGapSteps)) return kMaxGapSteps;
    return static_cast<int>(s);
}

void PushUnique(std::vector<Vec3>& out, const Vec3& p) {
    if (out.empty() || !(out.back() == p))
        out.push_back(p);
}

} // namespace

std::vector<Vec3> FillGap(const Vec3& from, const Vec3& to, const NavConfig& cfg) {
    std::vector<Vec3> points;
    const int steps = std::max(StepsFor(HorizontalDistance(from, to), cfg.nodeSpacing),
                               StepsFor(std::abs(to.y - from.y), cfg.maxVerticalStep));
    if (steps <= 1) return points;

    points.reserve(static_cast<std::size_t>(steps - 1));
    double prevY = from.y;
    for (int i = 1; i < steps; ++i) {
        const double t = static_cast<double>(i) / steps;
        const double y = ClampStep(from.y + (to.y - from.y) * t, prevY, cfg.maxVerticalStep);
        points.push_back({ from.x + (to.x - from.x) * t, y, from.z + (to.z - from.z) * t });
        prevY = y;
    }
    return points;
}

std::vector<Vec3> SmoothPath(const std::vector<Vec3>& path,
                             const IInteriorNavigator& interior,
                             const NavConfig& cfg) {
    if (path.size() <= 2) return path;

    std::vector<Vec3> smoothed;
    smoothed.reserve(path.size());
    smoothed.push_back(path.front());

    // Inside state of path[i + 1] is reused as path[i]'s on the next iteration.
    bool currInside = interior.IsInsideBuilding(path[1]);
    for (std::size_t i = 1; i + 1 < path.size(); ++i) {
        const Vec3& prev = path[i - 1];
        const Vec3& curr = path[i];
        const Vec3& next = path[i + 1];
        const bool nextInside = interior.IsInsideBuilding(next);

        if (currInside != nextInside) {
            smoothed.push_back(curr); // boundary waypoint stays exact
        } else {
            const double y = ClampStep((prev.y + curr.y + next.y) / 3.0, smoothed.back().y, cfg.maxVerticalStep);
            smoothed.push_back({ (prev.x + curr.x + next.x) / 3.0, y, (prev.z + curr.z + next.z) / 3.0 });
        }
        currInside = nextInside;
    }

    smoothed.push_back(path.back());
    return smoothed;
}

std::vector<Vec3> BuildFullPath(const Vec3& start, const Vec3& goal,
                                const RegionGraph& g,
                                const std::vector<std::uint32_t>& nodePath,
                                const IInteriorNavigator& interior,
                                const NavConfig& cfg) {
    std::vector<Vec3> full;
    full.push_back(start);

    Vec3 last = start;
    auto extendTo = [&](const Vec3& p) {
        for (const Vec3& q : FillGap(last, p, cfg)) PushUnique(full, q);
        PushUnique(full, p);
        last = p;
    };

    for (std::uint32_t id : nodePath)
        extendTo(g.node(id).node.pos());
    extendTo(goal);

    return SmoothPath(full, interior, cfg);
}

void AppendPath(std::vector<Vec3>& head, const std::vector<Vec3>& tail) {
    auto it = tail.begin();
    if (it != tail.end() && !head.empty() && head.back() == *it) ++it;
    head.insert(head.end(), it, tail.end());
}

} // namespace trailnav::nav
