#include "tilegen/map/TileType.hpp"

#include <cctype>

namespace tilegen::map {

namespace {

bool equals_i(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }
    return true;
}

} // namespace

std::string_view tile_type_name(TileType t) noexcept
{
    switch (t)
    {
        case TileType::Empty:  return "empty";
        case TileType::Ground: return "ground";
        case TileType::Wall:   return "wall";
        case TileType::Water:  return "water";
        case TileType::Grass:  return "grass";
        case TileType::Stone:  return "stone";
        case TileType::Sand:   return "sand";
        case TileType::Lava:   return "lava";
        case TileType::Ice:    return "ice";
    }
    return "unknown";
}

std::optional<TileType> parse_tile_type(std::string_view name) noexcept
{
    for (TileType t : kAllTileTypes)
    {
        if (equals_i(name, tile_type_name(t)))
            return t;
    }
    return std::nullopt;
}

} // namespace tilegen::map
