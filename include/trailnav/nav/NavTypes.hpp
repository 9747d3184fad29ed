#pragma once
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace trailnav::nav {

struct Vec3 {
    double x{}, y{}, z{};

    constexpr bool operator==(const Vec3&) const = default;

    [[nodiscard]] bool finite() const noexcept {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }
};

inline double DistanceSq(const Vec3& a, const Vec3& b) noexcept {
    const double dx = a.x - b.x, dy = a.y - b.y, dz = a.z - b.z;
    return dx * dx + dy * dy + dz * dz;
}

inline double Distance(const Vec3& a, const Vec3& b) noexcept {
    return std::sqrt(DistanceSq(a, b));
}

inline double HorizontalDistance(const Vec3& a, const Vec3& b) noexcept {
    const double dx = a.x - b.x, dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

inline Vec3 Midpoint(const Vec3& a, const Vec3& b) noexcept {
    return { (a.x + b.x) * 0.5, (a.y + b.y) * 0.5, (a.z + b.z) * 0.5 };
}

// Largest coordinate magnitude FindPath accepts. Keeps every derived cell
// index, plus the ring-search offsets around it, well inside int32.
inline constexpr double kWorldLimit = 1.0e9;

inline bool InWorld(const Vec3& v) noexcept {
    return v.finite() && std::abs(v.x) <= kWorldLimit && std::abs(v.y) <= kWorldLimit
        && std::abs(v.z) <= kWorldLimit;
}

// floor(v) as a cell index, saturated to +/-2^30; NaN maps to 0.
inline std::int32_t FloorToCell(double v) noexcept {
    constexpr double kCellLimit = 1073741824.0;
    const double f = std::floor(v);
    if (!(f >= -kCellLimit)) return f < 0.0 ? static_cast<std::int32_t>(-kCellLimit) : 0;
    if (f > kCellLimit) return static_cast<std::int32_t>(kCellLimit);
    return static_cast<std::int32_t>(f);
}

// Integer world cell (one block). y is up.
struct BlockPos {
    std::int32_t x{}, y{}, z{};

    constexpr bool operator==(const BlockPos&) const = default;

    [[nodiscard]] constexpr BlockPos offset(std::int32_t dx, std::int32_t dy, std::int32_t dz) const noexcept {
        return { x + dx, y + dy, z + dz };
    }
    [[nodiscard]] constexpr BlockPos up() const noexcept   { return offset(0, 1, 0); }
    [[nodiscard]] constexpr BlockPos down() const noexcept { return offset(0, -1, 0); }

    [[nodiscard]] Vec3 to_vec() const noexcept {
        return { static_cast<double>(x), static_cast<double>(y), static_cast<double>(z) };
    }

    static BlockPos from_vec(const Vec3& v) noexcept {
        return { FloorToCell(v.x), FloorToCell(v.y), FloorToCell(v.z) };
    }
};

// North, South, East, West in XZ.
inline constexpr BlockPos kCardinals[4] = { {0, 0, -1}, {0, 0, 1}, {1, 0, 0}, {-1, 0, 0} };

// Precomputed waypoint. Owned by the dataset, never mutated by a search.
struct NavNode {
    double x{}, y{}, z{};
    double cost{};

    [[nodiscard]] Vec3 pos() const noexcept { return { x, y, z }; }
};

using NavNodeSet = std::vector<NavNode>;

enum class PathStatus : std::uint8_t {
    Found,
    NoRoute,    // nothing routable with the data at hand
    Exhausted,  // transition points existed but every candidate failed
    Cancelled,  // superseded in PathService before it ran
};

const char* ToString(PathStatus s) noexcept;

struct PathStats {
    std::uint32_t regionGraphs   = 0;
    std::uint32_t nodesSelected  = 0;
    std::uint32_t nodesExpanded  = 0;
    std::uint32_t candidatesTried = 0;
};

struct PathResult {
    PathStatus status = PathStatus::NoRoute;
    std::vector<Vec3> points;
    PathStats stats{};

    [[nodiscard]] bool found() const noexcept { return status == PathStatus::Found; }
    [[nodiscard]] bool empty() const noexcept { return points.empty(); }
};

inline constexpr std::uint32_t kNoNode = std::numeric_limits<std::uint32_t>::max();

} // namespace trailnav::nav
