#include "tilegen/config/ConfigLoader.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace tilegen::config {

namespace
{
    // JSON integers are 64-bit; anything outside int is rejected rather than wrapped.
    int int_from_json(const std::string& key, const json& v)
    {
        if (!v.is_number_integer())
            throw std::runtime_error("'" + key + "' must be an integer");

        constexpr auto lo = std::numeric_limits<int>::min();
        constexpr auto hi = std::numeric_limits<int>::max();
        const bool fits = v.is_number_unsigned()
            ? v.get<std::uint64_t>() <= static_cast<std::uint64_t>(hi)
            : v.get<std::int64_t>() >= lo && v.get<std::int64_t>() <= hi;
        if (!fits)
            throw std::runtime_error("'" + key + "' is out of range: " + v.dump());
        return static_cast<int>(v.get<std::int64_t>());
    }

    ParamValue param_from_json(const std::string& key, const json& v)
    {
        if (v.is_boolean())         return v.get<bool>();
        if (v.is_number_integer())  return int_from_json(key, v);
        if (v.is_number_float())    return v.get<float>();
        if (v.is_string())          return v.get<std::string>();
        throw std::runtime_error("Parameter '" + key + "' must be a number, boolean or string");
    }

    EntityConfig entity_from_json(const json& e)
    {
        if (!e.is_object())
            throw std::runtime_error("Entity configuration must be an object");

        EntityConfig ec;
        const std::string typeName = e.value("type", std::string("Enemy"));
        const auto type = entities::parse_entity_type(typeName);
        if (!type)
            throw std::runtime_error("Unknown entity type '" + typeName + "'");
        ec.type = *type;

        if (e.contains("count"))
            ec.count = int_from_json("count", e.at("count"));
        ec.placementStrategy = e.value("placementStrategy", ec.placementStrategy);
        if (e.contains("minDistance"))
            ec.minDistance = e.at("minDistance").get<float>();
        ec.maxDistanceFromPlayer = e.value("maxDistanceFromPlayer", ec.maxDistanceFromPlayer);
        if (e.contains("properties"))
            ec.properties = param_map_from_json(e.at("properties"));
        return ec;
    }
}

ParamMap param_map_from_json(const json& j)
{
    ParamMap out;
    if (j.is_null())
        return out;
    if (!j.is_object())
        throw std::runtime_error("Parameters must be a JSON object");
    for (auto it = j.begin(); it != j.end(); ++it)
        out.emplace(it.key(), param_from_json(it.key(), it.value()));
    return out;
}

json param_map_to_json(const ParamMap& p)
{
    json out = json::object();
    for (const auto& [key, value] : p)
        std::visit([&](const auto& v) { out[key] = v; }, value);
    return out;
}

GenerationConfig parse_generation_config(const json& j)
{
    if (!j.is_object())
        throw std::runtime_error("Generation configuration must be a JSON object");

    GenerationConfig cfg;
    try
    {
        if (j.contains("width"))
            cfg.width = int_from_json("width", j.at("width"));
        if (j.contains("height"))
            cfg.height = int_from_json("height", j.at("height"));
        cfg.algorithm = j.value("algorithm", cfg.algorithm);

        if (j.contains("parameters"))
            cfg.parameters = param_map_from_json(j.at("parameters"));

        if (j.contains("terrainTypes"))
            cfg.terrainTypes = j.at("terrainTypes").get<std::vector<std::string>>();

        if (j.contains("entities"))
        {
            for (const auto& e : j.at("entities"))
                cfg.entities.push_back(entity_from_json(e));
        }
    }
    catch (const json::exception& ex)
    {
        throw std::runtime_error(std::string("Invalid generation configuration: ") + ex.what());
    }
    return cfg;
}

GenerationConfig load_generation_config(const fs::path& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f.is_open())
        throw std::runtime_error("Could not open " + path.string());

    json root;
    try
    {
        f >> root;
    }
    catch (const json::parse_error& ex)
    {
        throw std::runtime_error("Parse error in " + path.string() + ": " + ex.what());
    }
    return parse_generation_config(root);
}

} // namespace tilegen::config
