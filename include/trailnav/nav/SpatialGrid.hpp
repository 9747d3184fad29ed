#pragma once
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace trailnav::nav {

struct CellKey {
    std::int32_t cx = 0, cz = 0;
    constexpr bool operator==(const CellKey&) const = default;
};

struct CellKeyHash {
    std::size_t operator()(const CellKey& k) const noexcept {
        const std::uint64_t ux = static_cast<std::uint64_t>(static_cast<std::uint32_t>(k.cx));
        const std::uint64_t uz = static_cast<std::uint64_t>(static_cast<std::uint32_t>(k.cz));
        std::uint64_t h = (ux << 32) | uz;
        // SplitMix64 finaliser
        h += 0x9e3779b97f4a7c15ull;
        h = (h ^ (h >> 30)) * 0xbf58476d1ce4e5b9ull;
        h = (h ^ (h >> 27)) * 0x94d049bb133111ebull;
        h ^= (h >> 31);
        if constexpr (sizeof(std::size_t) < sizeof(std::uint64_t)) {
            return static_cast<std::size_t>(h ^ (h >> 32));
        } else {
            return static_cast<std::size_t>(h);
        }
    }
};

// Uniform XZ bucket index over item ids. Ids inside a cell keep insertion
// order, and neighbour visits go in a fixed (dx, dz) order, so iteration is
// deterministic for a given insertion sequence.
class SpatialGrid {
public:
    explicit SpatialGrid(std::int32_t cellSize);

    [[nodiscard]] std::int32_t cellSize() const noexcept { return cell_; }
    [[nodiscard]] CellKey KeyFor(double x, double z) const noexcept;

    void Insert(std::uint32_t id, double x, double z);
    void Reserve(std::size_t cells) { cells_.reserve(cells); }

    [[nodiscard]] std::size_t CellCount() const noexcept { return cells_.size(); }
    [[nodiscard]] const std::vector<std::uint32_t>* Cell(const CellKey& k) const;

    // Visit ids in the 3x3 block of cells around (x, z).
    template <class Fn>
    void ForEachNear(double x, double z, Fn&& fn) const {
        const CellKey c = KeyFor(x, z);
        for (std::int32_t dx = -1; dx <= 1; ++dx) {
            for (std::int32_t dz = -1; dz <= 1; ++dz) {
                const auto* ids = Cell({ c.cx + dx, c.cz + dz });
                if (!ids) continue;
                for (std::uint32_t id : *ids) fn(id);
            }
        }
    }

private:
    std::int32_t cell_;
    std::unordered_map<CellKey, std::vector<std::uint32_t>, CellKeyHash> cells_;
};

} // namespace trailnav::nav
