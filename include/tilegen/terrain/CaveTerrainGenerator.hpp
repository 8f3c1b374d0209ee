#pragma once
#include "tilegen/terrain/TerrainGenerator.hpp"

namespace tilegen::terrain {

struct CaveParams {
    float fillProbability = 0.45f; // 0..1, initial wall chance per interior cell
    int   iterations = 5;          // CA steps
    int   birthLimit = 5;          // floor with >= birthLimit wall neighbours -> wall
    int   deathLimit = 4;          // wall with <  deathLimit wall neighbours -> floor
    int   minRegionSize = 10;      // smaller same-type pockets are absorbed by their surroundings
    bool  keepLargestRegion = false;
    map::TileType wall  = map::TileType::Wall;
    map::TileType floor = map::TileType::Ground;
};

// "cellular": random fill, cellular-automaton smoothing, small-region cleanup.
class CaveTerrainGenerator final : public TerrainGeneratorBase {
public:
    std::string algorithm_name() const override { return "cellular"; }
    config::ParamMap default_parameters() const override;

    CaveParams read_params(const config::ParamMap& p) const;

    // Single CA step; the border ring is left untouched.
    static void step(map::TileMap& m, const CaveParams& P);
    // Absorbs pockets smaller than P.minRegionSize; returns the number of tiles changed.
    static std::size_t remove_small_regions(map::TileMap& m, const CaveParams& P);
    // Turns every floor region except the largest into wall; returns tiles changed.
    static std::size_t keep_largest_region(map::TileMap& m, const CaveParams& P);

protected:
    std::vector<config::ParamRule> parameter_rules() const override;
    map::WalkableSet walkable_policy(const config::GenerationConfig& cfg) const override;
    void carve(map::TileMap& m, const config::GenerationConfig& cfg, pcg::IRandomSource& rng) override;
};

} // namespace tilegen::terrain
