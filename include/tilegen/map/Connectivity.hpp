#pragma once
#include <array>
#include <cstddef>
#include <functional>
#include <vector>
#include "tilegen/map/TileMap.hpp"

namespace tilegen::map {

using CellPredicate = std::function<bool(const TileMap&, int x, int y)>;

// Walkable under the map's own walkable set.
bool walkable_cell(const TileMap& m, int x, int y);

// 4-connected flood fill from `start`. Empty if `start` is out of bounds or
// fails the predicate.
std::vector<Cell> flood_fill(const TileMap& m, Cell start, const CellPredicate& pred = walkable_cell);

struct RegionLabels {
    std::vector<int>         label;  // per cell (row-major), -1 = not part of any region
    std::vector<std::size_t> sizes;  // per region id
    std::vector<Cell>        seeds;  // first cell reached for each region

    [[nodiscard]] std::size_t region_count() const noexcept { return sizes.size(); }
    [[nodiscard]] int largest() const noexcept; // -1 if there are no regions
};

// Labels 4-connected regions of cells satisfying `pred`, scanning row-major.
RegionLabels label_regions(const TileMap& m, const CellPredicate& pred = walkable_cell);

// Same-type regions: two neighbours belong together iff their tiles are equal.
RegionLabels label_same_type_regions(const TileMap& m);

std::size_t largest_region_size(const TileMap& m);

// Fraction of walkable tiles in the largest walkable region; 0 if nothing is walkable.
float connectivity_ratio(const TileMap& m);

struct TerrainStats {
    std::array<std::size_t, kTileTypeCount> counts{};
    std::size_t total = 0;
    std::size_t walkable = 0;
    std::size_t regions = 0;
    std::size_t largestRegion = 0;
    float connectivity = 0.0f;

    [[nodiscard]] std::size_t count(TileType t) const noexcept { return counts[static_cast<std::size_t>(t)]; }
    [[nodiscard]] float walkable_fraction() const noexcept {
        return total ? static_cast<float>(walkable) / static_cast<float>(total) : 0.0f;
    }
};

TerrainStats compute_terrain_stats(const TileMap& m);

} // namespace tilegen::map
