#pragma once
#include <cstdint>
#include <filesystem>

namespace trailnav::nav {

// Tunables for graph construction, search and post-processing.
// Defaults reproduce the shipped behaviour; see LoadNavConfig for the file layout.
struct NavConfig {
    // graph
    double nodeSpacing       = 2.0;   // gap-fill spacing between resolved waypoints
    double searchRadius      = 200.0; // minimum region radius around the start/goal midpoint
    double connectionRange   = 10.0;  // max 3D distance of an edge
    double roadCost          = 15.0;  // nodes at or below this cost are roads
    double roadEdgeDiscount  = 0.1;
    double roadNearestWeight = 0.25;  // squared-distance scale for roads in nearest-node picks

    // search
    double cheapNodeThreshold      = 250.0;
    double expensiveNodeMultiplier = 100.0;
    double offRoadMultiplier       = 1000.0; // stepping from a road onto a non-road node
    double verticalDiffThreshold   = 2.5;
    double verticalPenalty         = 6.0;

    // interior
    double        maxInteriorDistance = 30.0;
    std::int32_t  exitSearchRange     = 32;
    std::int32_t  exitVerticalScan    = 2;
    std::int32_t  maxExitCandidates   = 3;
    double        minExitClearance    = 2.0;

    // smoothing
    double maxVerticalStep = 1.5;

    // debug
    bool trace = false;

    [[nodiscard]] bool IsRoad(double cost) const noexcept { return cost <= roadCost; }
};

// JSON file, e.g. nav.json:
//   { "version": 1,
//     "graph":     { "nodeSpacing": 2.0, "searchRadius": 200.0, ... },
//     "search":    { "cheapNodeThreshold": 250.0, ... },
//     "interior":  { "maxInteriorDistance": 30.0, "exitSearchRange": 32, ... },
//     "smoothing": { "maxVerticalStep": 1.5 },
//     "debug":     { "trace": false } }
// Missing keys keep the value already in `cfg`; bad values are ignored or clamped.
bool LoadNavConfig(NavConfig& cfg, const std::filesystem::path& file);
bool SaveNavConfig(const NavConfig& cfg, const std::filesystem::path& file);

// Brings every field back into its valid range.
void ClampNavConfig(NavConfig& cfg) noexcept;

} // namespace trailnav::nav
