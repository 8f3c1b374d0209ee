#pragma once
#include <cstddef>
#include <vector>
#include "tilegen/map/TileType.hpp"

namespace tilegen::map {

struct Cell {
    int x = 0;
    int y = 0;

    friend bool operator==(const Cell& a, const Cell& b) noexcept { return a.x == b.x && a.y == b.y; }
    friend bool operator!=(const Cell& a, const Cell& b) noexcept { return !(a == b); }
};

// Dense row-major tile grid. Dimensions are fixed at construction.
// get_tile/set_tile throw std::out_of_range for coordinates outside the map;
// that is a caller bug, not a recoverable condition.
class TileMap {
public:
    TileMap(int width, int height, TileType fillWith = TileType::Empty); // throws std::invalid_argument if either <= 0

    [[nodiscard]] int width()  const noexcept { return _w; }
    [[nodiscard]] int height() const noexcept { return _h; }
    [[nodiscard]] std::size_t size() const noexcept { return _tiles.size(); }

    [[nodiscard]] bool in_bounds(int x, int y) const noexcept {
        return static_cast<unsigned>(x) < static_cast<unsigned>(_w) &&
               static_cast<unsigned>(y) < static_cast<unsigned>(_h);
    }

    [[nodiscard]] TileType get_tile(int x, int y) const;
    void set_tile(int x, int y, TileType t);
    void fill(TileType t);

    // Unchecked access for hot loops that already iterate inside the bounds.
    [[nodiscard]] TileType at(int x, int y) const noexcept { return _tiles[index(x, y)]; }

    [[nodiscard]] bool is_walkable(int x, int y) const { return _walkable.contains(get_tile(x, y)); }
    [[nodiscard]] bool is_walkable(TileType t) const noexcept { return _walkable.contains(t); }

    [[nodiscard]] const WalkableSet& walkable_set() const noexcept { return _walkable; }
    void set_walkable_set(WalkableSet s) noexcept { _walkable = s; }

    [[nodiscard]] std::size_t count(TileType t) const noexcept;
    [[nodiscard]] std::size_t walkable_count() const noexcept;

    // Sets every tile on the outer ring to `t`.
    void fill_border(TileType t);
    [[nodiscard]] bool is_border(int x, int y) const noexcept {
        return x == 0 || y == 0 || x == _w - 1 || y == _h - 1;
    }

    friend bool operator==(const TileMap& a, const TileMap& b) noexcept {
        return a._w == b._w && a._h == b._h && a._tiles == b._tiles;
    }
    friend bool operator!=(const TileMap& a, const TileMap& b) noexcept { return !(a == b); }

private:
    [[nodiscard]] std::size_t index(int x, int y) const noexcept {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(_w) + static_cast<std::size_t>(x);
    }
    void check(int x, int y) const;

    int _w = 0;
    int _h = 0;
    std::vector<TileType> _tiles;
    WalkableSet _walkable = WalkableSet::defaults();
};

} // namespace tilegen::map
