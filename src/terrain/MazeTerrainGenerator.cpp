#include "tilegen/terrain/MazeTerrainGenerator.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace tilegen::terrain {

using config::ParamKind;
using config::ParamMap;
using map::Cell;
using map::TileMap;
using map::TileType;

namespace {

constexpr int kDx[4] = { 0, 1, 0,-1 };
constexpr int kDy[4] = {-1, 0, 1, 0 };

bool interior(const TileMap& m, int x, int y) {
    return x > 0 && y > 0 && x < m.width()-1 && y < m.height()-1;
}

int path_neighbors(const TileMap& m, TileType path, int x, int y) {
    int c = 0;
    for (int d=0; d<4; ++d) {
        const int nx=x+kDx[d], ny=y+kDy[d];
        if (m.in_bounds(nx,ny) && m.at(nx,ny) == path) ++c;
    }
    return c;
}

} // namespace

ParamMap MazeTerrainGenerator::default_parameters() const {
    return {
        { "algorithm",      std::string("recursive_backtracking") },
        { "wallType",       std::string("wall") },
        { "pathType",       std::string("ground") },
        { "complexity",     0.5f },
        { "density",        0.5f },
        { "braidingFactor", 0.0f },
    };
}

std::vector<config::ParamRule> MazeTerrainGenerator::parameter_rules() const {
    std::vector<std::string> tiles;
    for (TileType t : map::kAllTileTypes) tiles.emplace_back(map::tile_type_name(t));
    return {
        { "algorithm",      ParamKind::String, {},  {},  false, { "recursive_backtracking", "simple" }, "Unknown maze algorithm" },
        { "wallType",       ParamKind::String, {},  {},  false, tiles, "Unknown wall tile type" },
        { "pathType",       ParamKind::String, {},  {},  false, tiles, "Unknown path tile type" },
        { "complexity",     ParamKind::Float,  0.0, 1.0, false, {}, "Complexity must be between 0.0 and 1.0" },
        { "density",        ParamKind::Float,  0.0, 1.0, false, {}, "Density must be between 0.0 and 1.0" },
        { "braidingFactor", ParamKind::Float,  0.0, 1.0, false, {}, "Braiding factor must be between 0.0 and 1.0" },
    };
}

TileType MazeTerrainGenerator::wall_type(const ParamMap& p) const {
    return tile_from_name(param_string(p, "wallType"), TileType::Wall);
}

TileType MazeTerrainGenerator::path_type(const ParamMap& p) const {
    const TileType path = tile_from_name(param_string(p, "pathType"), TileType::Ground);
    return path == wall_type(p) ? TileType::Ground : path;
}

map::WalkableSet MazeTerrainGenerator::walkable_policy(const config::GenerationConfig& cfg) const {
    map::WalkableSet s = map::WalkableSet::defaults();
    TileType wall = wall_type(cfg.parameters);
    TileType path = path_type(cfg.parameters);
    if (wall == path) wall = TileType::Wall;
    s.insert(path);
    s.erase(wall);
    return s;
}

std::vector<Cell> MazeTerrainGenerator::find_dead_ends(const TileMap& m, TileType path) {
    std::vector<Cell> out;
    for (int y=1; y<m.height()-1; ++y)
        for (int x=1; x<m.width()-1; ++x)
            if (m.at(x,y) == path && path_neighbors(m, path, x, y) == 1)
                out.push_back({x,y});
    return out;
}

void MazeTerrainGenerator::carve_backtracking(TileMap& m, TileType path, pcg::IRandomSource& rng) {
    const int cellsX = (m.width()  - 1) / 2;
    const int cellsY = (m.height() - 1) / 2;
    if (cellsX <= 0 || cellsY <= 0) return;

    const int sx = 2*rng.next_int(0, cellsX) + 1;
    const int sy = 2*rng.next_int(0, cellsY) + 1;
    if (!interior(m, sx, sy)) return;

    std::vector<Cell> stack{ {sx,sy} };
    m.set_tile(sx, sy, path);

    int options[4];
    while (!stack.empty()) {
        const Cell c = stack.back();
        int n = 0;
        for (int d=0; d<4; ++d) {
            const int nx=c.x+2*kDx[d], ny=c.y+2*kDy[d];
            if (interior(m, nx, ny) && m.at(nx,ny) != path) options[n++] = d;
        }
        if (n == 0) { stack.pop_back(); continue; }

        const int d = options[rng.next_int(0, n)];
        m.set_tile(c.x+kDx[d], c.y+kDy[d], path);
        m.set_tile(c.x+2*kDx[d], c.y+2*kDy[d], path);
        stack.push_back({ c.x+2*kDx[d], c.y+2*kDy[d] });
    }
}

void MazeTerrainGenerator::carve_simple(TileMap& m, TileType wall, TileType path,
                                        float complexity, float density, pcg::IRandomSource& rng) {
    for (int y=1; y<m.height()-1; y+=2)
        for (int x=1; x<m.width()-1; x+=2)
            m.set_tile(x, y, path);

    if (m.width() < 3 || m.height() < 3) return;
    const auto probes = static_cast<long long>(
        static_cast<double>(m.width()) * m.height() * complexity * density / 4.0);
    for (long long i=0; i<probes; ++i) {
        const int x = rng.next_int(1, m.width()-1);
        const int y = rng.next_int(1, m.height()-1);
        if (x % 2 == 0 || y % 2 == 0)
            m.set_tile(x, y, rng.chance(density) ? wall : path);
    }
}

std::size_t MazeTerrainGenerator::braid(TileMap& m, TileType wall, TileType path,
                                        float factor, pcg::IRandomSource& rng) {
    std::size_t removed = 0;
    Cell preferred[4], any[4];
    for (const Cell& c : find_dead_ends(m, path)) {
        if (!rng.chance(factor)) continue;
        if (path_neighbors(m, path, c.x, c.y) != 1) continue; // opened by an earlier braid

        int np = 0, na = 0;
        for (int d=0; d<4; ++d) {
            const int wx=c.x+kDx[d], wy=c.y+kDy[d];
            if (!interior(m, wx, wy) || m.at(wx,wy) != wall) continue;
            any[na++] = {wx,wy};
            const int bx=wx+kDx[d], by=wy+kDy[d];
            if (m.in_bounds(bx,by) && m.at(bx,by) == path) preferred[np++] = {wx,wy};
        }
        if (na == 0) continue;

        const Cell w = np > 0 ? preferred[rng.next_int(0, np)] : any[rng.next_int(0, na)];
        m.set_tile(w.x, w.y, path);
        ++removed;
    }
    return removed;
}

void MazeTerrainGenerator::carve(TileMap& m, const config::GenerationConfig& cfg, pcg::IRandomSource& rng) {
    const ParamMap& p = cfg.parameters;
    TileType wall = wall_type(p);
    const TileType path = path_type(p);
    if (wall == path) wall = TileType::Wall;
    std::string algorithm = param_string(p, "algorithm");
    std::transform(algorithm.begin(), algorithm.end(), algorithm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    m.fill(wall);
    if (algorithm == "simple")
        carve_simple(m, wall, path, param_float(p, "complexity"), param_float(p, "density"), rng);
    else
        carve_backtracking(m, path, rng);

    _stats = MazeStats{};
    _stats.deadEndsBefore = find_dead_ends(m, path).size();
    const float factor = param_float(p, "braidingFactor");
    if (factor > 0.0f)
        _stats.wallsRemoved = braid(m, wall, path, factor, rng);
    _stats.deadEndsAfter = find_dead_ends(m, path).size();

    spdlog::debug("maze: algorithm={} dead ends {} -> {} ({} walls removed)",
                  algorithm, _stats.deadEndsBefore, _stats.deadEndsAfter, _stats.wallsRemoved);
}

} // namespace tilegen::terrain
