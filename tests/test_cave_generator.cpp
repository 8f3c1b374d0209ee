#include <doctest/doctest.h>
#include "tilegen/map/Connectivity.hpp"
#include "tilegen/terrain/CaveTerrainGenerator.hpp"

using namespace tilegen;
using map::TileType;

namespace {

config::GenerationConfig cave_config(int w, int h, config::ParamMap params = {}) {
    config::GenerationConfig cfg;
    cfg.width = w;
    cfg.height = h;
    cfg.algorithm = "cellular";
    cfg.parameters = std::move(params);
    return cfg;
}

} // namespace

TEST_CASE("CaveGen/Deterministic") {
    terrain::CaveTerrainGenerator gen;
    const auto cfg = cave_config(48, 32);
    CHECK(gen.generate_terrain(cfg, 77) == gen.generate_terrain(cfg, 77));
    CHECK(gen.generate_terrain(cfg, 77) != gen.generate_terrain(cfg, 78));
}

TEST_CASE("CaveGen/OnlyWallAndFloorWithWallBorder") {
    terrain::CaveTerrainGenerator gen;
    const auto m = gen.generate_terrain(cave_config(40, 40), 3);
    CHECK(m.count(TileType::Wall) + m.count(TileType::Ground) == m.size());
    for (int x = 0; x < m.width(); ++x) {
        CHECK(m.get_tile(x, 0) == TileType::Wall);
        CHECK(m.get_tile(x, m.height() - 1) == TileType::Wall);
    }
    for (int y = 0; y < m.height(); ++y) {
        CHECK(m.get_tile(0, y) == TileType::Wall);
        CHECK(m.get_tile(m.width() - 1, y) == TileType::Wall);
    }
    CHECK(m.walkable_count() > 0u);
}

TEST_CASE("CaveGen/FullFillStaysSolid") {
    terrain::CaveTerrainGenerator gen;
    const auto m = gen.generate_terrain(cave_config(20, 20, { { "fillProbability", 1.0f } }), 1);
    CHECK(m.walkable_count() == 0u);
}

TEST_CASE("CaveGen/KeepLargestRegionConnects") {
    terrain::CaveTerrainGenerator gen;
    for (uint64_t seed = 1; seed <= 5; ++seed) {
        const auto m = gen.generate_terrain(cave_config(50, 40, { { "keepLargestRegion", true } }), seed);
        if (m.walkable_count() == 0u) continue;
        CHECK(map::connectivity_ratio(m) == doctest::Approx(1.0f));
    }
}

TEST_CASE("CaveGen/CustomTileTypes") {
    terrain::CaveTerrainGenerator gen;
    const auto m = gen.generate_terrain(
        cave_config(30, 30, { { "wallType", std::string("stone") }, { "floorType", std::string("water") } }), 4);
    CHECK(m.count(TileType::Ground) == 0u);
    CHECK(m.count(TileType::Stone) + m.count(TileType::Water) + m.count(TileType::Wall) == m.size());
    CHECK(m.walkable_set().contains(TileType::Water));
    CHECK_FALSE(m.walkable_set().contains(TileType::Stone));
    CHECK(m.walkable_count() == m.count(TileType::Water));
}

TEST_CASE("CaveGen/StepRule") {
    terrain::CaveParams P; // birth 5, death 4
    map::TileMap m(5, 5, TileType::Ground);
    m.fill_border(TileType::Wall);
    m.set_tile(2, 2, TileType::Wall);

    terrain::CaveTerrainGenerator::step(m, P);
    CHECK(m.get_tile(2, 2) == TileType::Ground); // isolated wall dies
    CHECK(m.get_tile(1, 1) == TileType::Wall);   // corner floor sees 6 walls
    CHECK(m.get_tile(2, 1) == TileType::Ground); // edge floor sees 4 walls
}

TEST_CASE("CaveGen/SmallRegionsAbsorbed") {
    terrain::CaveParams P;
    P.minRegionSize = 4;
    map::TileMap m(9, 9, TileType::Ground);
    m.fill_border(TileType::Wall);
    m.set_tile(4, 4, TileType::Wall);      // one-tile pillar in open floor
    m.set_tile(6, 2, TileType::Wall);
    m.set_tile(6, 3, TileType::Wall);

    const std::size_t changed = terrain::CaveTerrainGenerator::remove_small_regions(m, P);
    CHECK(changed == 3u);
    CHECK(m.get_tile(4, 4) == TileType::Ground);
    CHECK(m.get_tile(6, 2) == TileType::Ground);

    map::TileMap pocket(7, 7, TileType::Wall);
    pocket.set_tile(3, 3, TileType::Ground); // enclosed one-tile floor
    CHECK(terrain::CaveTerrainGenerator::remove_small_regions(pocket, P) == 1u);
    CHECK(pocket.count(TileType::Ground) == 0u);
}

TEST_CASE("CaveGen/ManySmallRegionsAbsorbed") {
    terrain::CaveParams P;
    P.minRegionSize = 2;
    map::TileMap m(61, 61, TileType::Ground);
    m.fill_border(TileType::Wall);
    std::size_t pillars = 0;
    for (int y = 3; y < 58; y += 3)
        for (int x = 3; x < 58; x += 3) { m.set_tile(x, y, TileType::Wall); ++pillars; }

    CHECK(terrain::CaveTerrainGenerator::remove_small_regions(m, P) == pillars);
    CHECK(m.count(TileType::Wall) == 4u * 60u);
}

TEST_CASE("CaveGen/KeepLargestRegionHelper") {
    terrain::CaveParams P;
    map::TileMap m(9, 5, TileType::Wall);
    for (int x = 1; x <= 4; ++x) m.set_tile(x, 2, TileType::Ground);
    m.set_tile(7, 2, TileType::Ground);
    CHECK(terrain::CaveTerrainGenerator::keep_largest_region(m, P) == 1u);
    CHECK(m.count(TileType::Ground) == 4u);
}

TEST_CASE("CaveGen/Validation") {
    terrain::CaveTerrainGenerator gen;
    CHECK(gen.supports_parameters(gen.default_parameters()));

    auto errors = gen.validate_parameters({ { "birthLimit", 9 } });
    REQUIRE(errors.size() == 1u);
    CHECK(errors[0] == "Birth limit must be between 0 and 8");

    CHECK_FALSE(gen.supports_parameters({ { "fillProbability", 1.2f } }));
    CHECK_FALSE(gen.supports_parameters({ { "iterations", -1 } }));
    CHECK_FALSE(gen.supports_parameters({ { "deathLimit", -2 } }));
    CHECK_FALSE(gen.supports_parameters({ { "wallType", std::string("magma") } }));
    CHECK_FALSE(gen.supports_parameters({ { "iterations", 2.5f } }));
    CHECK_FALSE(gen.supports_parameters({ { "scale", 0.1f } }));
}
