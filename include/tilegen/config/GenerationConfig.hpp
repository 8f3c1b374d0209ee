#pragma once
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "tilegen/config/ParamValue.hpp"
#include "tilegen/entities/Entity.hpp"

namespace tilegen::config {

inline constexpr float kDefaultMinDistance = 1.0f;
inline constexpr int   kMinDimension = 3;
inline constexpr int   kMaxDimension = 1000;

struct EntityConfig {
    entities::EntityType type = entities::EntityType::Enemy;
    int   count = 1;                            // <= 0 places nothing
    std::string placementStrategy = "random";
    std::optional<float> minDistance;           // kDefaultMinDistance when unset
    float maxDistanceFromPlayer = std::numeric_limits<float>::infinity();
    ParamMap properties;                        // copied onto every placed entity

    [[nodiscard]] float effective_min_distance() const noexcept {
        return minDistance.value_or(kDefaultMinDistance);
    }
    [[nodiscard]] int effective_count() const noexcept { return count > 0 ? count : 0; }
};

struct GenerationConfig {
    int width  = 50;
    int height = 50;
    std::string algorithm = "perlin";
    ParamMap parameters;
    std::vector<EntityConfig> entities;
    std::vector<std::string> terrainTypes;      // empty = every terrain type permitted

    // True if `name` (case-insensitive) is permitted by terrainTypes.
    [[nodiscard]] bool permits_terrain(std::string_view name) const;
};

// Names accepted by GenerationConfig::algorithm and EntityConfig::placementStrategy.
const std::vector<std::string>& known_algorithms();
const std::vector<std::string>& known_placement_strategies();

// Whole-configuration sanity check. Never throws; empty means valid.
// Algorithm parameters are checked by the generator itself.
std::vector<std::string> validate_config(const GenerationConfig& cfg);

} // namespace tilegen::config
