#pragma once
#include <cstddef>
#include "tilegen/terrain/TerrainGenerator.hpp"

namespace tilegen::terrain {

struct MazeStats {
    std::size_t deadEndsBefore = 0;
    std::size_t deadEndsAfter  = 0;
    std::size_t wallsRemoved   = 0;
};

// "maze": logical cells on odd coordinates, walls on the lattice between them.
class MazeTerrainGenerator final : public TerrainGeneratorBase {
public:
    std::string algorithm_name() const override { return "maze"; }
    config::ParamMap default_parameters() const override;

    // Statistics of the most recent generate_terrain() call.
    [[nodiscard]] const MazeStats& last_stats() const noexcept { return _stats; }

    // Interior path tiles with exactly one orthogonal path neighbour.
    static std::vector<map::Cell> find_dead_ends(const map::TileMap& m, map::TileType path);

protected:
    std::vector<config::ParamRule> parameter_rules() const override;
    map::WalkableSet walkable_policy(const config::GenerationConfig& cfg) const override;
    void carve(map::TileMap& m, const config::GenerationConfig& cfg, pcg::IRandomSource& rng) override;

private:
    static void carve_backtracking(map::TileMap& m, map::TileType path, pcg::IRandomSource& rng);
    static void carve_simple(map::TileMap& m, map::TileType wall, map::TileType path,
                             float complexity, float density, pcg::IRandomSource& rng);
    static std::size_t braid(map::TileMap& m, map::TileType wall, map::TileType path,
                             float factor, pcg::IRandomSource& rng);

    map::TileType wall_type(const config::ParamMap& p) const;
    map::TileType path_type(const config::ParamMap& p) const;

    MazeStats _stats;
};

} // namespace tilegen::terrain
