#include "tilegen/map/TileMap.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tilegen::map {

TileMap::TileMap(int width, int height, TileType fillWith)
    : _w(width), _h(height)
{
    if (width <= 0 || height <= 0)
        throw std::invalid_argument("TileMap: dimensions must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    _tiles.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), fillWith);
}

void TileMap::check(int x, int y) const
{
    if (!in_bounds(x, y))
        throw std::out_of_range("TileMap: (" + std::to_string(x) + "," + std::to_string(y) +
                                ") outside " + std::to_string(_w) + "x" + std::to_string(_h));
}

TileType TileMap::get_tile(int x, int y) const
{
    check(x, y);
    return _tiles[index(x, y)];
}

void TileMap::set_tile(int x, int y, TileType t)
{
    check(x, y);
    _tiles[index(x, y)] = t;
}

void TileMap::fill(TileType t)
{
    std::fill(_tiles.begin(), _tiles.end(), t);
}

void TileMap::fill_border(TileType t)
{
    for (int x = 0; x < _w; ++x) { _tiles[index(x, 0)] = t; _tiles[index(x, _h - 1)] = t; }
    for (int y = 0; y < _h; ++y) { _tiles[index(0, y)] = t; _tiles[index(_w - 1, y)] = t; }
}

std::size_t TileMap::count(TileType t) const noexcept
{
    return static_cast<std::size_t>(std::count(_tiles.begin(), _tiles.end(), t));
}

std::size_t TileMap::walkable_count() const noexcept
{
    return static_cast<std::size_t>(std::count_if(_tiles.begin(), _tiles.end(),
        [this](TileType t) { return _walkable.contains(t); }));
}

} // namespace tilegen::map
