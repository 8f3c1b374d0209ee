#include <doctest/doctest.h>
#include "tilegen/map/Connectivity.hpp"
#include "tilegen/pcg/Rng.hpp"
#include "tilegen/terrain/NoiseTerrainGenerator.hpp"

#include <stdexcept>

using namespace tilegen;
using map::TileType;

namespace {

config::GenerationConfig perlin_config(int w, int h) {
    config::GenerationConfig cfg;
    cfg.width = w;
    cfg.height = h;
    cfg.algorithm = "perlin";
    return cfg;
}

bool border_is_wall(const map::TileMap& m) {
    for (int y = 0; y < m.height(); ++y)
        for (int x = 0; x < m.width(); ++x)
            if (m.is_border(x, y) && m.get_tile(x, y) != TileType::Wall) return false;
    return true;
}

} // namespace

TEST_CASE("NoiseGen/SameSeedSameMap") {
    terrain::NoiseTerrainGenerator gen;
    const auto cfg = perlin_config(40, 30);
    CHECK(gen.generate_terrain(cfg, 42) == gen.generate_terrain(cfg, 42));
    CHECK(gen.generate_terrain(cfg, 42) != gen.generate_terrain(cfg, 43));
}

TEST_CASE("NoiseGen/SharedStreamMatchesSeed") {
    terrain::NoiseTerrainGenerator gen;
    const auto cfg = perlin_config(25, 25);
    pcg::Rng rng(9);
    CHECK(gen.generate_terrain(cfg, rng) == gen.generate_terrain(cfg, 9));
}

TEST_CASE("NoiseGen/BorderAndDimensions") {
    terrain::NoiseTerrainGenerator gen;
    const auto m = gen.generate_terrain(perlin_config(17, 9), 1);
    CHECK(m.width() == 17);
    CHECK(m.height() == 9);
    CHECK(border_is_wall(m));
    CHECK(m.count(TileType::Empty) == 0u);
}

TEST_CASE("NoiseGen/ProducesMixedTerrain") {
    terrain::NoiseTerrainGenerator gen;
    auto cfg = perlin_config(64, 64);
    cfg.parameters = { { "scale", 0.08f } };
    const auto s = map::compute_terrain_stats(gen.generate_terrain(cfg, 2024));
    CHECK(s.walkable > 0u);
    CHECK(s.count(TileType::Wall) >= 4u * 63u);
}

TEST_CASE("NoiseGen/TerrainTypesRestrictOutput") {
    terrain::NoiseTerrainGenerator gen;
    auto cfg = perlin_config(48, 48);
    cfg.terrainTypes = { "ground", "wall" };
    const auto m = gen.generate_terrain(cfg, 7);
    CHECK(m.count(TileType::Water) == 0u);
    CHECK(m.count(TileType::Stone) == 0u);
    CHECK(m.count(TileType::Grass) == 0u);
}

TEST_CASE("NoiseGen/Classify") {
    config::GenerationConfig cfg;
    using G = terrain::NoiseTerrainGenerator;
    CHECK(G::classify(0.1f, 0.3f, 0.7f, cfg) == TileType::Water);
    CHECK(G::classify(0.5f, 0.3f, 0.7f, cfg) == TileType::Ground);
    CHECK(G::classify(0.65f, 0.3f, 0.7f, cfg) == TileType::Grass);
    CHECK(G::classify(0.9f, 0.3f, 0.7f, cfg) == TileType::Stone);

    cfg.terrainTypes = { "ground" };
    CHECK(G::classify(0.1f, 0.3f, 0.7f, cfg) == TileType::Ground);
    CHECK(G::classify(0.65f, 0.3f, 0.7f, cfg) == TileType::Ground);
    CHECK(G::classify(0.9f, 0.3f, 0.7f, cfg) == TileType::Wall);
}

TEST_CASE("NoiseGen/Validation") {
    terrain::NoiseTerrainGenerator gen;
    CHECK(gen.supports_parameters(gen.default_parameters()));
    CHECK(gen.supports_parameters({}));

    auto errors = gen.validate_parameters({ { "scale", 0.0f } });
    REQUIRE(errors.size() == 1u);
    CHECK(errors[0] == "Scale must be greater than 0");

    errors = gen.validate_parameters({ { "waterLevel", 0.8f }, { "mountainLevel", 0.4f } });
    REQUIRE(errors.size() == 1u);
    CHECK(errors[0] == "Water level must be less than mountain level");

    CHECK_FALSE(gen.supports_parameters({ { "octaves", 0 } }));
    CHECK_FALSE(gen.supports_parameters({ { "persistence", 1.5f } }));
    CHECK_FALSE(gen.supports_parameters({ { "lacunarity", 0.5f } }));
    CHECK_FALSE(gen.supports_parameters({ { "iterations", 3 } }));
    CHECK_FALSE(gen.supports_parameters({ { "scale", std::string("big") } }));
}

TEST_CASE("NoiseGen/InvalidParametersFallBackToDefaults") {
    terrain::NoiseTerrainGenerator gen;
    auto bad = perlin_config(30, 30);
    bad.parameters = { { "scale", -1.0f }, { "octaves", 0 }, { "unknownKey", 3 } };
    CHECK(gen.generate_terrain(bad, 5) == gen.generate_terrain(perlin_config(30, 30), 5));
}

TEST_CASE("NoiseGen/NonPositiveDimensionsThrow") {
    terrain::NoiseTerrainGenerator gen;
    CHECK_THROWS_AS(gen.generate_terrain(perlin_config(0, 10), 1), std::invalid_argument);
    CHECK_THROWS_AS(gen.generate_terrain(perlin_config(10, -3), 1), std::invalid_argument);
}

TEST_CASE("NoiseGen/TinyMapIsAllBorder") {
    terrain::NoiseTerrainGenerator gen;
    const auto m = gen.generate_terrain(perlin_config(2, 1), 3);
    CHECK(m.count(TileType::Wall) == 2u);
}

TEST_CASE("NoiseGen/HugeScaleAndLacunarity") {
    terrain::NoiseTerrainGenerator gen;
    auto cfg = perlin_config(8, 8);
    cfg.parameters = { { "scale", 1.0e9f } };
    CHECK(gen.validate_parameters(cfg.parameters).empty());
    const auto a = gen.generate_terrain(cfg, 3);
    CHECK(a == gen.generate_terrain(cfg, 3));
    CHECK(border_is_wall(a));

    cfg.parameters = { { "lacunarity", 1.0e4f }, { "octaves", 8 } };
    CHECK(gen.validate_parameters(cfg.parameters).empty());
    CHECK(gen.generate_terrain(cfg, 4).count(TileType::Empty) == 0u);
}
