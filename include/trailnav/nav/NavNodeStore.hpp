#pragma once
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <vector>
#include "NavTypes.hpp"

namespace trailnav::nav {

// Immutable-snapshot holder for the shared nav node dataset.
//
// One writer calls Publish() (e.g. after the loader finishes); any number of
// pathfinding threads call Snapshot(). A snapshot is never modified after it is
// published, so a query keeps using the one it captured even if a newer set is
// swapped in meanwhile.
class NavNodeStore {
public:
    NavNodeStore();
    explicit NavNodeStore(std::vector<NavNode> nodes);

    NavNodeStore(const NavNodeStore&) = delete;
    NavNodeStore& operator=(const NavNodeStore&) = delete;

    // Drops nodes with non-finite fields. Returns the number of nodes kept.
    std::size_t Publish(std::vector<NavNode> nodes);

    [[nodiscard]] std::shared_ptr<const NavNodeSet> Snapshot() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::uint64_t version() const;

private:
    mutable std::shared_mutex mu_;
    std::shared_ptr<const NavNodeSet> nodes_;
    std::uint64_t version_ = 0;
};

} // namespace trailnav::nav
