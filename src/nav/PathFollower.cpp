#include "trailnav/nav/PathFollower.hpp"
#include "trailnav/core/Log.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace trailnav::nav {

const char* ToString(FollowEvent e) noexcept {
    switch (e) {
    case FollowEvent::None:               return "none";
    case FollowEvent::WaypointReached:    return "waypoint-reached";
    case FollowEvent::Completed:          return "completed";
    case FollowEvent::NeedsRecalculation: return "needs-recalculation";
    case FollowEvent::GaveUp:             return "gave-up";
    case FollowEvent::TimedOut:           return "timed-out";
    }
    return "unknown";
}

double PathLength(const std::vector<Vec3>& points) noexcept {
    double total = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i)
        total += Distance(points[i - 1], points[i]);
    return total;
}

PathFollower::PathFollower(FollowerConfig cfg) : cfg_(cfg) {}

bool PathFollower::Start(const PathResult& path, const Vec3& destination, Clock::time_point now) {
    Stop();
    if (!path.found() || path.points.empty()) return false;

    const double length = PathLength(path.points);
    if (length < cfg_.minPathLength) {
        logsys::get()->debug("Path of length {:.2f} is below the minimum {:.2f}", length, cfg_.minPathLength);
        return false;
    }

    remaining_   = path.points;
    destination_ = destination;
    lastPlan_    = now;
    active_      = true;
    return true;
}

void PathFollower::Stop() noexcept {
    remaining_.clear();
    reached_   = 0;
    failed_    = 0;
    active_    = false;
    awaiting_  = false;
    hasAnchor_ = false;
}

FollowEvent PathFollower::Update(const Vec3& agentPos, Clock::time_point now) {
    if (!active_) return FollowEvent::None;

    if (now - lastPlan_ > cfg_.pathTimeout) {
        logsys::get()->debug("Path navigation timed out");
        Stop();
        return FollowEvent::TimedOut;
    }

    if (!remaining_.empty() && Distance(agentPos, remaining_.front()) <= cfg_.waypointReachDistance) {
        remaining_.erase(remaining_.begin());
        ++reached_;
        if (remaining_.empty()) {
            active_ = false;
            return FollowEvent::Completed;
        }
        return FollowEvent::WaypointReached;
    }

    if (awaiting_) return FollowEvent::None;
    if (ShouldRecalculate(agentPos, now)) return RequestRecalculation(now);
    if (IsStuck(agentPos, now)) {
        logsys::get()->debug("Agent has not moved for {} ms, replanning",
                             std::chrono::duration_cast<std::chrono::milliseconds>(now - anchorTime_).count());
        return RequestRecalculation(now);
    }
    return FollowEvent::None;
}

FollowEvent PathFollower::RequestRecalculation(Clock::time_point now) {
    if (failed_ >= cfg_.maxFailedAttempts) {
        Stop();
        return FollowEvent::GaveUp;
    }
    awaiting_ = true;
    lastPlan_ = now;
    return FollowEvent::NeedsRecalculation;
}

FollowEvent PathFollower::ApplyRecalculation(const PathResult& result, Clock::time_point now) {
    if (!active_) return FollowEvent::None;
    awaiting_ = false;

    if (result.found() && !result.points.empty()) {
        remaining_ = result.points;
        failed_    = 0;
        lastPlan_  = now;
        return FollowEvent::None;
    }

    ++failed_;
    logsys::get()->debug("Recalculation failed ({}): attempt {} of {}",
                         ToString(result.status), failed_, cfg_.maxFailedAttempts);
    if (failed_ >= cfg_.maxFailedAttempts) {
        Stop();
        return FollowEvent::GaveUp;
    }
    return FollowEvent::None;
}

bool PathFollower::ShouldRecalculate(const Vec3& agentPos, Clock::time_point now) const {
    if (now - lastPlan_ < cfg_.recalcCooldown) return false;

    double nearest = std::numeric_limits<double>::max();
    for (const Vec3& p : remaining_)
        nearest = std::min(nearest, Distance(agentPos, p));
    return nearest > cfg_.recalcDistance;
}

bool PathFollower::IsStuck(const Vec3& agentPos, Clock::time_point now) {
    if (!hasAnchor_ || Distance(agentPos, anchor_) >= cfg_.stuckDistance) {
        anchor_     = agentPos;
        anchorTime_ = now;
        hasAnchor_  = true;
        return false;
    }
    const Clock::time_point since = std::max(anchorTime_, lastPlan_);
    return now - since > cfg_.stuckTimeout;
}

} // namespace trailnav::nav
