#pragma once
#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace tilegen::map {

enum class TileType : uint8_t {
    Empty,
    Ground,
    Wall,
    Water,
    Grass,
    Stone,
    Sand,
    Lava,
    Ice,
};

inline constexpr int kTileTypeCount = 9;

inline constexpr std::array<TileType, kTileTypeCount> kAllTileTypes = {
    TileType::Empty, TileType::Ground, TileType::Wall,  TileType::Water, TileType::Grass,
    TileType::Stone, TileType::Sand,   TileType::Lava,  TileType::Ice,
};

// Lower-case names as used in configuration files ("ground", "wall", ...).
std::string_view        tile_type_name(TileType t) noexcept;
std::optional<TileType> parse_tile_type(std::string_view name) noexcept; // case-insensitive

// Set of tile types entities may stand on. Generators decide the policy;
// the map only stores it.
class WalkableSet {
public:
    constexpr WalkableSet() = default;
    constexpr WalkableSet(std::initializer_list<TileType> types) {
        for (TileType t : types) _bits |= bit(t);
    }

    // Ground, Grass and Sand.
    static constexpr WalkableSet defaults() {
        return WalkableSet{TileType::Ground, TileType::Grass, TileType::Sand};
    }

    constexpr bool contains(TileType t) const noexcept { return (_bits & bit(t)) != 0; }
    constexpr void insert(TileType t) noexcept { _bits |= bit(t); }
    constexpr void erase(TileType t) noexcept  { _bits &= static_cast<uint16_t>(~bit(t)); }
    constexpr bool empty() const noexcept { return _bits == 0; }

    friend constexpr bool operator==(WalkableSet a, WalkableSet b) noexcept { return a._bits == b._bits; }
    friend constexpr bool operator!=(WalkableSet a, WalkableSet b) noexcept { return a._bits != b._bits; }

private:
    static constexpr uint16_t bit(TileType t) noexcept {
        return static_cast<uint16_t>(1u << static_cast<unsigned>(t));
    }
    uint16_t _bits = 0;
};

} // namespace tilegen::map
