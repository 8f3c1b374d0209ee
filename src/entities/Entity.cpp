#include "tilegen/entities/Entity.hpp"

#include <cctype>

namespace tilegen::entities {

std::string_view entity_type_name(EntityType t) noexcept
{
    switch (t)
    {
        case EntityType::Player:     return "Player";
        case EntityType::Enemy:      return "Enemy";
        case EntityType::Item:       return "Item";
        case EntityType::PowerUp:    return "PowerUp";
        case EntityType::NPC:        return "NPC";
        case EntityType::Exit:       return "Exit";
        case EntityType::Checkpoint: return "Checkpoint";
        case EntityType::Obstacle:   return "Obstacle";
        case EntityType::Trigger:    return "Trigger";
    }
    return "Unknown";
}

std::optional<EntityType> parse_entity_type(std::string_view name) noexcept
{
    for (EntityType t : kAllEntityTypes)
    {
        const std::string_view n = entity_type_name(t);
        if (n.size() != name.size())
            continue;

        bool same = true;
        for (std::size_t i = 0; i < n.size() && same; ++i)
            same = std::tolower(static_cast<unsigned char>(n[i])) ==
                   std::tolower(static_cast<unsigned char>(name[i]));
        if (same)
            return t;
    }
    return std::nullopt;
}

} // namespace tilegen::entities
