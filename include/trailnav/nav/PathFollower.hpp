#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "NavTypes.hpp"

namespace trailnav::nav {

struct FollowerConfig {
    double waypointReachDistance = 3.0;
    double recalcDistance        = 10.0;  // off-path distance that triggers a replan
    std::chrono::milliseconds recalcCooldown{ 2000 };
    int    maxFailedAttempts     = 3;
    double minPathLength         = 5.0;
    std::chrono::milliseconds pathTimeout{ 300000 }; // since the last (re)plan
    double stuckDistance         = 1.0;
    std::chrono::milliseconds stuckTimeout{ 6000 };  // 3 x recalcCooldown
};

enum class FollowEvent : std::uint8_t {
    None,
    WaypointReached,
    Completed,
    NeedsRecalculation, // caller should FindPath(agentPos, destination()) and ApplyRecalculation
    GaveUp,
    TimedOut,           // no (re)plan within pathTimeout; the follower is idle again
};

const char* ToString(FollowEvent e) noexcept;

// Sum of segment lengths.
[[nodiscard]] double PathLength(const std::vector<Vec3>& points) noexcept;

// Walks one agent along a found path. Not thread-safe; owned by whoever ticks
// the agent.
class PathFollower {
public:
    using Clock = std::chrono::steady_clock;

    explicit PathFollower(FollowerConfig cfg = {});

    // Returns false (and stays idle) unless `path` is Found and at least
    // minPathLength long.
    bool Start(const PathResult& path, const Vec3& destination, Clock::time_point now);
    void Stop() noexcept;

    FollowEvent Update(const Vec3& agentPos, Clock::time_point now);

    // Feeds back the replan requested by NeedsRecalculation.
    FollowEvent ApplyRecalculation(const PathResult& result, Clock::time_point now);

    [[nodiscard]] bool active() const noexcept { return active_; }
    [[nodiscard]] bool awaitingRecalculation() const noexcept { return awaiting_; }
    [[nodiscard]] const Vec3& destination() const noexcept { return destination_; }
    [[nodiscard]] const std::vector<Vec3>& remaining() const noexcept { return remaining_; }
    [[nodiscard]] std::size_t reached() const noexcept { return reached_; }
    [[nodiscard]] int failedAttempts() const noexcept { return failed_; }

private:
    bool ShouldRecalculate(const Vec3& agentPos, Clock::time_point now) const;
    bool IsStuck(const Vec3& agentPos, Clock::time_point now);
    FollowEvent RequestRecalculation(Clock::time_point now);

    FollowerConfig cfg_;
    std::vector<Vec3> remaining_;
    Vec3 destination_{};
    Clock::time_point lastPlan_{};
    Vec3 anchor_{};                  // last position the agent moved away from
    Clock::time_point anchorTime_{};
    bool hasAnchor_ = false;
    std::size_t reached_ = 0;
    int  failed_   = 0;
    bool active_   = false;
    bool awaiting_ = false;
};

} // namespace trailnav::nav
