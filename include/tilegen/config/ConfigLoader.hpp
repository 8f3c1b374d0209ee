#pragma once
#include <filesystem>
#include <nlohmann/json.hpp>
#include "tilegen/config/GenerationConfig.hpp"

namespace tilegen::config {

// JSON layout:
//   {
//     "width": 40, "height": 30, "algorithm": "cellular",
//     "parameters": { "fillProbability": 0.45, "iterations": 5 },
//     "terrainTypes": ["ground", "wall"],
//     "entities": [ { "type": "Enemy", "count": 3, "placementStrategy": "random",
//                     "minDistance": 2.0, "maxDistanceFromPlayer": 20.0,
//                     "properties": { "health": 10 } } ]
//   }
// Missing keys keep the GenerationConfig defaults. Structural problems
// (unknown entity type, parameter values that are not scalars) throw
// std::runtime_error. Range checks are left to validate_config and the
// generators.
GenerationConfig parse_generation_config(const nlohmann::json& j);

// Throws std::runtime_error if the file cannot be opened or is not valid JSON.
GenerationConfig load_generation_config(const std::filesystem::path& path);

ParamMap       param_map_from_json(const nlohmann::json& j);
nlohmann::json param_map_to_json(const ParamMap& p);

} // namespace tilegen::config
