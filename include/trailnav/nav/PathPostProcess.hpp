#pragma once
#include <cstdint>
#include <vector>
#include "IInteriorNavigator.hpp"
#include "NavConfig.hpp"
#include "NavTypes.hpp"
#include "RegionGraph.hpp"

namespace trailnav::nav {

// Points strictly between `from` and `to`, spaced so that neither the
// horizontal spacing exceeds nodeSpacing nor the elevation change exceeds
// maxVerticalStep. Each point's y is clamped against the previous one.
[[nodiscard]] std::vector<Vec3> FillGap(const Vec3& from, const Vec3& to, const NavConfig& cfg);

// Single-pass 3-point average of the inner points. A point whose inside state
// differs from its successor is copied unchanged, as are both endpoints.
[[nodiscard]] std::vector<Vec3> SmoothPath(const std::vector<Vec3>& path,
                                           const IInteriorNavigator& interior,
                                           const NavConfig& cfg);

// start, gap-filled node chain, goal; then smoothed.
[[nodiscard]] std::vector<Vec3> BuildFullPath(const Vec3& start, const Vec3& goal,
                                              const RegionGraph& g,
                                              const std::vector<std::uint32_t>& nodePath,
                                              const IInteriorNavigator& interior,
                                              const NavConfig& cfg);

// Appends `tail` to `head`, skipping the first tail point when it repeats the
// last head point.
void AppendPath(std::vector<Vec3>& head, const std::vector<Vec3>& tail);

} // namespace trailnav::nav
