#include "tilegen/terrain/NoiseTerrainGenerator.hpp"
#include "tilegen/pcg/Noise.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace tilegen::terrain {

using config::ParamKind;
using config::ParamMap;
using map::TileType;

namespace {
constexpr float kGrassLevel   = 0.6f;   // normalised noise above which ground turns to grass
constexpr float kOffsetRange  = 256.0f; // keeps samples away from the lattice origin
}

ParamMap NoiseTerrainGenerator::default_parameters() const {
    return {
        { "scale",         0.1f },
        { "octaves",       4    },
        { "persistence",   0.5f },
        { "lacunarity",    2.0f },
        { "waterLevel",    0.3f },
        { "mountainLevel", 0.7f },
    };
}

std::vector<config::ParamRule> NoiseTerrainGenerator::parameter_rules() const {
    return {
        { "scale",         ParamKind::Float, 0.0, {},  true,  {}, "Scale must be greater than 0" },
        { "octaves",       ParamKind::Int,   1.0, {},  false, {}, "Octaves must be at least 1" },
        { "persistence",   ParamKind::Float, 0.0, 1.0, false, {}, "Persistence must be between 0 and 1.0" },
        { "lacunarity",    ParamKind::Float, 1.0, {},  false, {}, "Lacunarity must be at least 1.0" },
        { "waterLevel",    ParamKind::Float, 0.0, 1.0, false, {}, "Water level must be between 0 and 1.0" },
        { "mountainLevel", ParamKind::Float, 0.0, 1.0, false, {}, "Mountain level must be between 0 and 1.0" },
    };
}

void NoiseTerrainGenerator::validate_extra(const ParamMap& params, std::vector<std::string>& errors) const {
    const auto w = params.find("waterLevel");
    const auto m = params.find("mountainLevel");
    if (w == params.end() || m == params.end()) return;

    const auto wl = config::as_float(w->second);
    const auto ml = config::as_float(m->second);
    if (wl && ml && *wl >= *ml)
        errors.push_back("Water level must be less than mountain level");
}

TileType NoiseTerrainGenerator::classify(float v, float waterLevel, float mountainLevel,
                                         const config::GenerationConfig& cfg) {
    if (v < waterLevel)
        return cfg.permits_terrain("water") ? TileType::Water : TileType::Ground;
    if (v > mountainLevel)
        return cfg.permits_terrain("stone") ? TileType::Stone : TileType::Wall;
    if (v > kGrassLevel && cfg.permits_terrain("grass"))
        return TileType::Grass;
    return TileType::Ground;
}

void NoiseTerrainGenerator::carve(map::TileMap& m, const config::GenerationConfig& cfg, pcg::IRandomSource& rng) {
    const ParamMap& p = cfg.parameters;
    const float scale       = param_float(p, "scale");
    const int   octaves     = param_int(p, "octaves");
    const float persistence = param_float(p, "persistence");
    const float lacunarity  = param_float(p, "lacunarity");
    float waterLevel        = param_float(p, "waterLevel");
    float mountainLevel     = param_float(p, "mountainLevel");
    if (waterLevel >= mountainLevel) {
        waterLevel    = config::get_float(default_parameters(), "waterLevel", 0.3f);
        mountainLevel = config::get_float(default_parameters(), "mountainLevel", 0.7f);
    }

    pcg::Perlin perlin(rng);
    const float ox = rng.next_float(0.0f, kOffsetRange);
    const float oy = rng.next_float(0.0f, kOffsetRange);

    float lo = 1.0f, hi = 0.0f;
    for (int y = 0; y < m.height(); ++y) {
        for (int x = 0; x < m.width(); ++x) {
            const float n = perlin.octave_noise((x + ox) * scale, (y + oy) * scale, octaves, persistence, lacunarity);
            const float v = (n + 1.0f) * 0.5f;
            lo = std::min(lo, v); hi = std::max(hi, v);
            m.set_tile(x, y, classify(v, waterLevel, mountainLevel, cfg));
        }
    }
    spdlog::debug("perlin: scale={} octaves={} persistence={} lacunarity={} noise range [{:.3f}, {:.3f}]",
                  scale, octaves, persistence, lacunarity, lo, hi);
}

} // namespace tilegen::terrain
