#pragma once
#include <cstdint>
#include <vector>
#include "tilegen/config/GenerationConfig.hpp"
#include "tilegen/entities/Entity.hpp"
#include "tilegen/map/TileMap.hpp"
#include "tilegen/pcg/RandomSource.hpp"

namespace tilegen::placement {

class IEntityPlacer {
public:
    virtual ~IEntityPlacer() = default;

    // One Player, then every EntityConfig request in order. Units that find no
    // valid tile are skipped, so the result may hold fewer entities than asked.
    virtual std::vector<entities::Entity> place_entities(const map::TileMap& m,
                                                         const config::GenerationConfig& cfg,
                                                         uint64_t seed) = 0;
    virtual std::vector<entities::Entity> place_entities(const map::TileMap& m,
                                                         const config::GenerationConfig& cfg,
                                                         pcg::IRandomSource& rng) = 0;

    // In bounds, walkable, and at least `minDistance` from every entity in `others`.
    virtual bool is_valid_position(entities::Vec2f pos,
                                   const map::TileMap& m,
                                   const std::vector<entities::Entity>& others,
                                   float minDistance = config::kDefaultMinDistance) const = 0;
};

class EntityPlacer final : public IEntityPlacer {
public:
    std::vector<entities::Entity> place_entities(const map::TileMap& m,
                                                 const config::GenerationConfig& cfg,
                                                 uint64_t seed) override;
    std::vector<entities::Entity> place_entities(const map::TileMap& m,
                                                 const config::GenerationConfig& cfg,
                                                 pcg::IRandomSource& rng) override;

    bool is_valid_position(entities::Vec2f pos,
                           const map::TileMap& m,
                           const std::vector<entities::Entity>& others,
                           float minDistance = config::kDefaultMinDistance) const override;

    // Per-unit sampling budget of the random strategy.
    [[nodiscard]] static std::size_t attempt_budget(std::size_t freeTiles) noexcept;

    static constexpr std::size_t kMaxAttempts = 4096;
    static constexpr int   kClusterRadius = 3;
    static constexpr float kCornerRadiusFraction = 0.3f;
};

} // namespace tilegen::placement
