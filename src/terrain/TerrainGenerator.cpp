#include "tilegen/terrain/TerrainGenerator.hpp"
#include "tilegen/map/Connectivity.hpp"
#include "tilegen/pcg/Rng.hpp"

#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace tilegen::terrain {

using config::ParamMap;
using map::TileMap;

TileMap TerrainGeneratorBase::generate_terrain(const config::GenerationConfig& cfg, uint64_t seed)
{
    pcg::Rng rng(seed);
    return generate_terrain(cfg, rng);
}

TileMap TerrainGeneratorBase::generate_terrain(const config::GenerationConfig& cfg, pcg::IRandomSource& rng)
{
    if (cfg.width <= 0 || cfg.height <= 0)
        throw std::invalid_argument(algorithm_name() + ": dimensions must be positive, got " +
                                    std::to_string(cfg.width) + "x" + std::to_string(cfg.height));

    const auto problems = validate_parameters(cfg.parameters);
    for (const auto& p : problems)
        spdlog::warn("{}: {}", algorithm_name(), p);

    // Entries that fail their own rule are dropped so the defaults apply.
    config::GenerationConfig effective = cfg;
    if (!problems.empty())
    {
        const auto rules = parameter_rules();
        effective.parameters.clear();
        for (const auto& [key, value] : cfg.parameters)
        {
            ParamMap single{ { key, value } };
            if (config::validate_params(single, rules, algorithm_name()).empty())
                effective.parameters.emplace(key, value);
        }
    }

    const auto t0 = std::chrono::steady_clock::now();

    TileMap m(cfg.width, cfg.height);
    m.set_walkable_set(walkable_policy(effective));
    carve(m, effective, rng);
    m.fill_border(map::TileType::Wall);

    const auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    if (spdlog::should_log(spdlog::level::debug))
    {
        const map::TerrainStats s = map::compute_terrain_stats(m);
        spdlog::debug("{}: {}x{} seed={} walkable={} ({:.1f}%) regions={} connectivity={:.2f}",
                      algorithm_name(), m.width(), m.height(), rng.seed(), s.walkable,
                      100.0f * s.walkable_fraction(), s.regions, s.connectivity);
    }
    spdlog::info("{}: generated {}x{} terrain in {:.2f} ms", algorithm_name(), m.width(), m.height(), ms);
    return m;
}

std::vector<std::string> TerrainGeneratorBase::validate_parameters(const ParamMap& params) const
{
    std::vector<std::string> errors = config::validate_params(params, parameter_rules(), algorithm_name() + " generator");
    validate_extra(params, errors);
    return errors;
}

float TerrainGeneratorBase::param_float(const ParamMap& p, const char* key) const
{
    return config::get_float(p, key, config::get_float(default_parameters(), key, 0.0f));
}

int TerrainGeneratorBase::param_int(const ParamMap& p, const char* key) const
{
    return config::get_int(p, key, config::get_int(default_parameters(), key, 0));
}

bool TerrainGeneratorBase::param_bool(const ParamMap& p, const char* key) const
{
    return config::get_bool(p, key, config::get_bool(default_parameters(), key, false));
}

std::string TerrainGeneratorBase::param_string(const ParamMap& p, const char* key) const
{
    return config::get_string(p, key, config::get_string(default_parameters(), key, {}));
}

map::TileType TerrainGeneratorBase::tile_from_name(const std::string& name, map::TileType fallback)
{
    return map::parse_tile_type(name).value_or(fallback);
}

} // namespace tilegen::terrain
