#include "tilegen/terrain/CaveTerrainGenerator.hpp"
#include "tilegen/map/Connectivity.hpp"

#include <array>
#include <vector>
#include <spdlog/spdlog.h>

namespace tilegen::terrain {

using config::ParamKind;
using config::ParamMap;
using map::TileMap;
using map::TileType;

namespace {

std::vector<std::string> tile_names() {
    std::vector<std::string> out;
    for (TileType t : map::kAllTileTypes) out.emplace_back(map::tile_type_name(t));
    return out;
}

int count_wall_neighbors(const TileMap& m, TileType wall, int x, int y) {
    int c = 0;
    for (int dy=-1; dy<=1; ++dy)
    for (int dx=-1; dx<=1; ++dx) {
        if (dx==0 && dy==0) continue;
        const int nx=x+dx, ny=y+dy;
        if (!m.in_bounds(nx,ny)) { c++; continue; } // out of bounds counts as wall
        c += (m.at(nx,ny) == wall);
    }
    return c;
}

} // namespace

ParamMap CaveTerrainGenerator::default_parameters() const {
    return {
        { "fillProbability",   0.45f },
        { "iterations",        5 },
        { "birthLimit",        5 },
        { "deathLimit",        4 },
        { "minRegionSize",     10 },
        { "keepLargestRegion", false },
        { "wallType",          std::string("wall") },
        { "floorType",         std::string("ground") },
    };
}

std::vector<config::ParamRule> CaveTerrainGenerator::parameter_rules() const {
    return {
        { "fillProbability",   ParamKind::Float,  0.0, 1.0, false, {}, "Fill probability must be between 0.0 and 1.0" },
        { "iterations",        ParamKind::Int,    0.0, {},  false, {}, "Iterations must be 0 or more" },
        { "birthLimit",        ParamKind::Int,    0.0, 8.0, false, {}, "Birth limit must be between 0 and 8" },
        { "deathLimit",        ParamKind::Int,    0.0, 8.0, false, {}, "Death limit must be between 0 and 8" },
        { "minRegionSize",     ParamKind::Int,    0.0, {},  false, {}, "Minimum region size must be 0 or more" },
        { "keepLargestRegion", ParamKind::Bool,   {},  {},  false, {}, {} },
        { "wallType",          ParamKind::String, {},  {},  false, tile_names(), "Unknown wall tile type" },
        { "floorType",         ParamKind::String, {},  {},  false, tile_names(), "Unknown floor tile type" },
    };
}

CaveParams CaveTerrainGenerator::read_params(const ParamMap& p) const {
    CaveParams P;
    P.fillProbability   = param_float(p, "fillProbability");
    P.iterations        = param_int(p, "iterations");
    P.birthLimit        = param_int(p, "birthLimit");
    P.deathLimit        = param_int(p, "deathLimit");
    P.minRegionSize     = param_int(p, "minRegionSize");
    P.keepLargestRegion = param_bool(p, "keepLargestRegion");
    P.wall  = tile_from_name(param_string(p, "wallType"),  TileType::Wall);
    P.floor = tile_from_name(param_string(p, "floorType"), TileType::Ground);
    if (P.wall == P.floor) {
        P.wall  = TileType::Wall;
        P.floor = TileType::Ground;
    }
    return P;
}

map::WalkableSet CaveTerrainGenerator::walkable_policy(const config::GenerationConfig& cfg) const {
    const CaveParams P = read_params(cfg.parameters);
    map::WalkableSet s = map::WalkableSet::defaults();
    s.insert(P.floor);
    s.erase(P.wall);
    return s;
}

void CaveTerrainGenerator::step(TileMap& m, const CaveParams& P) {
    const int W = m.width(), H = m.height();
    std::vector<TileType> next(static_cast<std::size_t>(W) * static_cast<std::size_t>(H));
    for (int y=1; y<H-1; ++y) {
        for (int x=1; x<W-1; ++x) {
            const int n = count_wall_neighbors(m, P.wall, x, y);
            const bool wall = (m.at(x,y) == P.wall) ? (n >= P.deathLimit) : (n >= P.birthLimit);
            next[static_cast<std::size_t>(y)*W + x] = wall ? P.wall : P.floor;
        }
    }
    for (int y=1; y<H-1; ++y)
        for (int x=1; x<W-1; ++x)
            m.set_tile(x, y, next[static_cast<std::size_t>(y)*W + x]);
}

std::size_t CaveTerrainGenerator::remove_small_regions(TileMap& m, const CaveParams& P) {
    if (P.minRegionSize <= 0) return 0;

    const map::RegionLabels r = map::label_same_type_regions(m);
    const int W = m.width();
    static const int dx[4] = { 1,-1,0,0 };
    static const int dy[4] = { 0,0,1,-1 };

    const auto undersized = [&](int id) {
        return id >= 0 && r.sizes[static_cast<std::size_t>(id)] < static_cast<std::size_t>(P.minRegionSize);
    };

    // Votes of the tiles bordering each undersized region, taken from the
    // unmodified map in one pass so the result does not depend on scan order.
    std::vector<std::array<std::size_t, map::kTileTypeCount>> votes(r.region_count());
    for (int y=0; y<m.height(); ++y) {
        for (int x=0; x<W; ++x) {
            const int id = r.label[static_cast<std::size_t>(y)*W + x];
            if (!undersized(id)) continue;
            for (int d=0; d<4; ++d) {
                const int nx=x+dx[d], ny=y+dy[d];
                if (!m.in_bounds(nx,ny)) continue;
                if (r.label[static_cast<std::size_t>(ny)*W + nx] == id) continue;
                ++votes[static_cast<std::size_t>(id)][static_cast<std::size_t>(m.at(nx,ny))];
            }
        }
    }

    std::vector<int> replaceWith(r.region_count(), -1);
    for (std::size_t id = 0; id < r.region_count(); ++id) {
        if (!undersized(static_cast<int>(id))) continue;
        const auto& v = votes[id];
        std::size_t best = static_cast<std::size_t>(P.wall);
        for (std::size_t t = 0; t < v.size(); ++t)
            if (v[t] > v[best]) best = t;
        if (v[best] > 0 && best != static_cast<std::size_t>(m.at(r.seeds[id].x, r.seeds[id].y)))
            replaceWith[id] = static_cast<int>(best);
    }

    std::size_t changed = 0;
    for (int y=0; y<m.height(); ++y) {
        for (int x=0; x<W; ++x) {
            const int id = r.label[static_cast<std::size_t>(y)*W + x];
            if (id < 0 || replaceWith[static_cast<std::size_t>(id)] < 0) continue;
            m.set_tile(x, y, static_cast<TileType>(replaceWith[static_cast<std::size_t>(id)]));
            ++changed;
        }
    }
    return changed;
}

std::size_t CaveTerrainGenerator::keep_largest_region(TileMap& m, const CaveParams& P) {
    const map::RegionLabels r = map::label_regions(m,
        [&](const TileMap& mm, int x, int y) { return mm.at(x,y) == P.floor; });
    const int best = r.largest();
    if (best < 0) return 0;

    std::size_t changed = 0;
    const int W = m.width();
    for (int y=0; y<m.height(); ++y) {
        for (int x=0; x<W; ++x) {
            const int id = r.label[static_cast<std::size_t>(y)*W + x];
            if (id >= 0 && id != best) { m.set_tile(x, y, P.wall); ++changed; }
        }
    }
    return changed;
}

void CaveTerrainGenerator::carve(TileMap& m, const config::GenerationConfig& cfg, pcg::IRandomSource& rng) {
    const CaveParams P = read_params(cfg.parameters);

    m.fill(P.wall);
    for (int y=1; y<m.height()-1; ++y)
        for (int x=1; x<m.width()-1; ++x)
            m.set_tile(x, y, rng.chance(P.fillProbability) ? P.wall : P.floor);

    for (int s=0; s<P.iterations; ++s)
        step(m, P);

    const std::size_t absorbed = remove_small_regions(m, P);
    const std::size_t culled = P.keepLargestRegion ? keep_largest_region(m, P) : 0;

    spdlog::debug("cellular: fill={} iterations={} birth={} death={} absorbed={} culled={}",
                  P.fillProbability, P.iterations, P.birthLimit, P.deathLimit, absorbed, culled);
}

} // namespace tilegen::terrain
