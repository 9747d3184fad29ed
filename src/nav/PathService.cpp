#include "trailnav/nav/PathService.hpp"
#include "trailnav/core/Log.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace trailnav::nav {

PathService::PathService(const NavGraphPathfinder& pathfinder, std::size_t threads)
    : pathfinder_(pathfinder) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i)
        workers_.emplace_back([this] { WorkerLoop(); });
    logsys::get()->info("PathService started with {} worker(s)", workers_.size());
}

PathService::~PathService() {
    {
        std::lock_guard lk(mu_);
        stopping_ = true;
        if (!queue_.empty() || running_ > 0)
            logsys::get()->debug("PathService draining {} job(s)", queue_.size() + running_);
    }
    cv_.notify_all();
    for (auto& t : workers_) if (t.joinable()) t.join();
}

std::future<PathResult> PathService::Submit(AgentId agent, const Vec3& start, const Vec3& goal) {
    Job job;
    job.agent = agent;
    job.start = start;
    job.goal  = goal;
    std::future<PathResult> fut = job.promise.get_future();

    std::vector<Job> superseded;
    {
        std::lock_guard lk(mu_);
        if (stopping_)
            throw std::runtime_error("PathService is stopping");
        TakeQueued(agent, superseded);
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();

    if (!superseded.empty())
        logsys::get()->debug("Agent {}: {} queued path request(s) superseded", agent, superseded.size());
    ResolveCancelled(superseded);
    return fut;
}

bool PathService::Cancel(AgentId agent) {
    std::vector<Job> dropped;
    {
        std::lock_guard lk(mu_);
        TakeQueued(agent, dropped);
    }
    ResolveCancelled(dropped);
    return !dropped.empty();
}

std::size_t PathService::InFlight() const {
    std::lock_guard lk(mu_);
    return queue_.size() + running_;
}

void PathService::TakeQueued(AgentId agent, std::vector<Job>& out) {
    const auto keep = std::stable_partition(queue_.begin(), queue_.end(),
                                            [agent](const Job& j) { return j.agent != agent; });
    std::move(keep, queue_.end(), std::back_inserter(out));
    queue_.erase(keep, queue_.end());
}

void PathService::ResolveCancelled(std::vector<Job>& jobs) {
    for (Job& j : jobs) {
        PathResult cancelled;
        cancelled.status = PathStatus::Cancelled;
        j.promise.set_value(std::move(cancelled));
    }
}

void PathService::WorkerLoop() {
    for (;;) {
        Job job;
        {
            std::unique_lock lk(mu_);
            cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        PathResult result;
        std::exception_ptr error;
        try {
            result = pathfinder_.FindPath(job.start, job.goal);
        } catch (const std::exception& e) {
            logsys::get()->error("Path request for agent {} failed: {}", job.agent, e.what());
            error = std::current_exception();
        }

        // Release the slot before the caller can observe the result.
        {
            std::lock_guard lk(mu_);
            --running_;
        }
        if (error)
            job.promise.set_exception(error);
        else
            job.promise.set_value(std::move(result));
    }
}

} // namespace trailnav::nav
