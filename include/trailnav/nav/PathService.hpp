#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <vector>
#include "NavGraphPathfinder.hpp"
#include "NavTypes.hpp"

namespace trailnav::nav {

using AgentId = std::uint64_t;

inline constexpr std::size_t kMaxConcurrentPaths = 8;

// Runs NavGraphPathfinder::FindPath on its own workers, at most one queued
// request per agent.
//
// A newer Submit for the same agent (or Cancel) pulls the older request out of
// the queue and resolves it to PathStatus::Cancelled on the spot, so stale work
// never reaches a worker. A request a worker has already picked up runs to
// completion. Destruction finishes everything still queued, then joins.
class PathService {
public:
    explicit PathService(const NavGraphPathfinder& pathfinder,
                         std::size_t threads = kMaxConcurrentPaths);
    ~PathService();

    PathService(const PathService&) = delete;
    PathService& operator=(const PathService&) = delete;

    // Throws std::runtime_error while the service is shutting down.
    [[nodiscard]] std::future<PathResult> Submit(AgentId agent, const Vec3& start, const Vec3& goal);

    // True when a queued request was dropped.
    bool Cancel(AgentId agent);

    // Queued plus running requests.
    [[nodiscard]] std::size_t InFlight() const;

    [[nodiscard]] std::size_t threads() const noexcept { return workers_.size(); }

private:
    struct Job {
        AgentId agent = 0;
        Vec3 start{};
        Vec3 goal{};
        std::promise<PathResult> promise;
    };

    void WorkerLoop();

    // Moves the agent's queued jobs into `out`. Caller holds mu_.
    void TakeQueued(AgentId agent, std::vector<Job>& out);
    static void ResolveCancelled(std::vector<Job>& jobs);

    const NavGraphPathfinder& pathfinder_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<Job> queue_;
    std::size_t running_ = 0;
    bool stopping_ = false;

    std::vector<std::thread> workers_;
};

} // namespace trailnav::nav
