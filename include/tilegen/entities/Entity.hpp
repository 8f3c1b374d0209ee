#pragma once
#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string_view>
#include "tilegen/config/ParamValue.hpp"

namespace tilegen::entities {

enum class EntityType : uint8_t {
    Player,
    Enemy,
    Item,
    PowerUp,
    NPC,
    Exit,
    Checkpoint,
    Obstacle,
    Trigger,
};

inline constexpr std::array<EntityType, 9> kAllEntityTypes = {
    EntityType::Player, EntityType::Enemy, EntityType::Item,
    EntityType::PowerUp, EntityType::NPC, EntityType::Exit,
    EntityType::Checkpoint, EntityType::Obstacle, EntityType::Trigger,
};

std::string_view          entity_type_name(EntityType t) noexcept;
std::optional<EntityType> parse_entity_type(std::string_view name) noexcept; // case-insensitive

// Position in tile coordinates.
struct Vec2f {
    float x = 0.0f;
    float y = 0.0f;

    friend bool operator==(const Vec2f& a, const Vec2f& b) noexcept { return a.x == b.x && a.y == b.y; }
    friend bool operator!=(const Vec2f& a, const Vec2f& b) noexcept { return !(a == b); }
};

inline float distance(Vec2f a, Vec2f b) noexcept {
    return std::hypot(a.x - b.x, a.y - b.y);
}

struct Entity {
    uint32_t   id = 0;    // unique within one placement result, independent of position
    EntityType type = EntityType::Enemy;
    Vec2f      position{};
    config::ParamMap properties;
};

} // namespace tilegen::entities
