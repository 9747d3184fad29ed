#pragma once
#include <cstdint>
#include <span>
#include <vector>
#include "NavConfig.hpp"
#include "NavTypes.hpp"

namespace trailnav::nav {

struct RegionEdge {
    std::uint32_t target = kNoNode;
    double cost = 0.0;
};

class RegionGraph;

[[nodiscard]] RegionGraph BuildRegionGraph(const NavNodeSet& all,
                                           const Vec3& start, const Vec3& goal,
                                           const NavConfig& cfg);

// Per-query view of one nav node. Edges live in the owning graph's edge
// array at [firstEdge, firstEdge + edgeCount).
struct RegionNode {
    NavNode node;
    std::uint32_t firstEdge = 0;
    std::uint32_t edgeCount = 0;
};

// Ephemeral subgraph for a single FindPath call. Nodes and edges are two flat
// arrays addressed by index; the whole thing is dropped when the call returns.
class RegionGraph {
public:
    RegionGraph() = default;

    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t edgeCount() const noexcept { return edges_.size(); }

    [[nodiscard]] const RegionNode& node(std::uint32_t i) const { return nodes_[i]; }
    [[nodiscard]] const std::vector<RegionNode>& nodes() const noexcept { return nodes_; }
    [[nodiscard]] std::span<const RegionEdge> edges(std::uint32_t i) const {
        const RegionNode& n = nodes_[i];
        return { edges_.data() + n.firstEdge, n.edgeCount };
    }

    [[nodiscard]] const Vec3& center() const noexcept { return center_; }
    [[nodiscard]] double radius() const noexcept { return radius_; }

private:
    friend RegionGraph BuildRegionGraph(const NavNodeSet&, const Vec3&, const Vec3&, const NavConfig&);

    std::vector<RegionNode> nodes_;
    std::vector<RegionEdge> edges_;
    Vec3 center_{};
    double radius_ = 0.0;
};

// max(searchRadius, |goal - start| * 0.75)
[[nodiscard]] double RegionRadius(const Vec3& start, const Vec3& goal, const NavConfig& cfg) noexcept;

// Indices (into `all`) of nodes within the region radius of the start/goal midpoint.
[[nodiscard]] std::vector<std::uint32_t> SelectRegionNodes(const NavNodeSet& all,
                                                           const Vec3& start, const Vec3& goal,
                                                           const NavConfig& cfg);

// Edge weight: max of both costs, discounted when either end is a road.
[[nodiscard]] double EdgeCost(const NavNode& a, const NavNode& b, const NavConfig& cfg) noexcept;

// Node with the smallest XZ squared distance to `p`, with road nodes scaled by
// roadNearestWeight. kNoNode when the graph is empty. Ties keep the lower index.
[[nodiscard]] std::uint32_t FindNearestNode(const RegionGraph& g, const Vec3& p, const NavConfig& cfg) noexcept;

} // namespace trailnav::nav
