#pragma once
#include "tilegen/terrain/TerrainGenerator.hpp"

namespace tilegen::terrain {

// "perlin": octave Perlin noise thresholded into water / ground / grass / stone.
class NoiseTerrainGenerator final : public TerrainGeneratorBase {
public:
    std::string algorithm_name() const override { return "perlin"; }
    config::ParamMap default_parameters() const override;

    // Normalised noise value in [0,1] -> tile, honouring cfg.terrainTypes.
    static map::TileType classify(float value, float waterLevel, float mountainLevel,
                                  const config::GenerationConfig& cfg);

protected:
    std::vector<config::ParamRule> parameter_rules() const override;
    void validate_extra(const config::ParamMap& params, std::vector<std::string>& errors) const override;
    void carve(map::TileMap& m, const config::GenerationConfig& cfg, pcg::IRandomSource& rng) override;
};

} // namespace tilegen::terrain
