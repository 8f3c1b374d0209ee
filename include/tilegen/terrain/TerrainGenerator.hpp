#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "tilegen/config/GenerationConfig.hpp"
#include "tilegen/map/TileMap.hpp"
#include "tilegen/pcg/RandomSource.hpp"

namespace tilegen::terrain {

class ITerrainGenerator {
public:
    virtual ~ITerrainGenerator() = default;

    // Fresh random stream seeded with `seed`; same config and seed give the same map.
    virtual map::TileMap generate_terrain(const config::GenerationConfig& cfg, uint64_t seed) = 0;
    // Draws from a caller-owned stream, e.g. one later handed to the entity placer.
    virtual map::TileMap generate_terrain(const config::GenerationConfig& cfg, pcg::IRandomSource& rng) = 0;

    virtual std::string algorithm_name() const = 0;
    virtual config::ParamMap default_parameters() const = 0;
    virtual std::vector<std::string> validate_parameters(const config::ParamMap& params) const = 0;

    bool supports_parameters(const config::ParamMap& params) const {
        return validate_parameters(params).empty();
    }
};

// Shared skeleton: dimension check, map allocation, walkable policy, border
// ring, statistics logging. Subclasses only fill in carve().
class TerrainGeneratorBase : public ITerrainGenerator {
public:
    map::TileMap generate_terrain(const config::GenerationConfig& cfg, uint64_t seed) override;
    map::TileMap generate_terrain(const config::GenerationConfig& cfg, pcg::IRandomSource& rng) override;

    std::vector<std::string> validate_parameters(const config::ParamMap& params) const override;

protected:
    // Per-algorithm rule table consumed by validate_parameters().
    virtual std::vector<config::ParamRule> parameter_rules() const = 0;
    // Extra checks spanning several parameters.
    virtual void validate_extra(const config::ParamMap&, std::vector<std::string>&) const {}

    virtual void carve(map::TileMap& m, const config::GenerationConfig& cfg, pcg::IRandomSource& rng) = 0;
    virtual map::WalkableSet walkable_policy(const config::GenerationConfig&) const {
        return map::WalkableSet::defaults();
    }

    // Missing keys fall back to default_parameters().
    float       param_float (const config::ParamMap& p, const char* key) const;
    int         param_int   (const config::ParamMap& p, const char* key) const;
    bool        param_bool  (const config::ParamMap& p, const char* key) const;
    std::string param_string(const config::ParamMap& p, const char* key) const;

    // Names in configuration are lower-case tile names; unknown names map to `fallback`.
    static map::TileType tile_from_name(const std::string& name, map::TileType fallback);
};

} // namespace tilegen::terrain
