#include "tilegen/config/GenerationConfig.hpp"
#include "tilegen/map/TileType.hpp"

#include <algorithm>
#include <cctype>

namespace tilegen::config {

namespace {

std::string lower(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool contains_i(const std::vector<std::string>& list, std::string_view name)
{
    const std::string n = lower(name);
    return std::any_of(list.begin(), list.end(),
        [&](const std::string& s) { return lower(s) == n; });
}

std::string join(const std::vector<std::string>& list)
{
    std::string out;
    for (const auto& s : list)
    {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

} // namespace

bool GenerationConfig::permits_terrain(std::string_view name) const
{
    return terrainTypes.empty() || contains_i(terrainTypes, name);
}

const std::vector<std::string>& known_algorithms()
{
    static const std::vector<std::string> names{ "perlin", "cellular", "maze" };
    return names;
}

const std::vector<std::string>& known_placement_strategies()
{
    static const std::vector<std::string> names{
        "random", "clustered", "spread", "near_walls", "center", "far_from_player", "corners"
    };
    return names;
}

std::vector<std::string> validate_config(const GenerationConfig& cfg)
{
    std::vector<std::string> errors;

    const auto dimOk = [](int v) { return v >= kMinDimension && v <= kMaxDimension; };
    if (!dimOk(cfg.width))
        errors.push_back("Width must be between " + std::to_string(kMinDimension) + " and " +
                         std::to_string(kMaxDimension) + " tiles");
    if (!dimOk(cfg.height))
        errors.push_back("Height must be between " + std::to_string(kMinDimension) + " and " +
                         std::to_string(kMaxDimension) + " tiles");

    if (!contains_i(known_algorithms(), cfg.algorithm))
        errors.push_back("Invalid generation algorithm '" + cfg.algorithm +
                         "'. Valid algorithms are: " + join(known_algorithms()));

    for (const auto& t : cfg.terrainTypes)
    {
        if (t.empty())
            errors.push_back("Terrain types list contains an empty terrain type");
        else if (!map::parse_tile_type(t) || lower(t) == "empty")
            errors.push_back("Invalid terrain type '" + t + "'");
    }

    for (std::size_t i = 0; i < cfg.entities.size(); ++i)
    {
        const EntityConfig& e = cfg.entities[i];
        const std::string prefix = "Entity configuration " + std::to_string(i + 1) + ": ";

        if (!contains_i(known_placement_strategies(), e.placementStrategy))
            errors.push_back(prefix + "Unknown placement strategy '" + e.placementStrategy +
                             "'. Valid strategies are: " + join(known_placement_strategies()));

        const float minD = e.effective_min_distance();
        if (minD < 0.0f || minD > 100.0f)
            errors.push_back(prefix + "Minimum distance must be between 0 and 100");
        if (e.maxDistanceFromPlayer < 0.0f)
            errors.push_back(prefix + "Maximum distance from player must be positive");
        if (minD > e.maxDistanceFromPlayer)
            errors.push_back(prefix + "Minimum distance cannot be greater than maximum distance from player");
    }
    return errors;
}

} // namespace tilegen::config
