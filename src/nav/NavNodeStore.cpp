#include "trailnav/nav/NavNodeStore.hpp"
#include "trailnav/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

namespace trailnav::nav {

NavNodeStore::NavNodeStore()
    : nodes_(std::make_shared<const NavNodeSet>()) {}

NavNodeStore::NavNodeStore(std::vector<NavNode> nodes)
    : NavNodeStore() {
    Publish(std::move(nodes));
}

std::size_t NavNodeStore::Publish(std::vector<NavNode> nodes) {
    const std::size_t before = nodes.size();
    nodes.erase(std::remove_if(nodes.begin(), nodes.end(), [](const NavNode& n) {
                    return !std::isfinite(n.x) || !std::isfinite(n.y) || !std::isfinite(n.z)
                        || !std::isfinite(n.cost);
                }),
                nodes.end());

    if (nodes.size() != before)
        logsys::get()->warn("NavNodeStore: dropped {} nodes with non-finite data", before - nodes.size());

    auto snapshot = std::make_shared<const NavNodeSet>(std::move(nodes));
    const std::size_t kept = snapshot->size();

    std::unique_lock lk(mu_);
    nodes_ = std::move(snapshot);
    ++version_;
    return kept;
}

std::shared_ptr<const NavNodeSet> NavNodeStore::Snapshot() const {
    std::shared_lock lk(mu_);
    return nodes_;
}

std::size_t NavNodeStore::size() const {
    std::shared_lock lk(mu_);
    return nodes_->size();
}

std::uint64_t NavNodeStore::version() const {
    std::shared_lock lk(mu_);
    return version_;
}

} // namespace trailnav::nav
