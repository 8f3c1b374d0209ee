#include "tilegen/map/Connectivity.hpp"

#include <queue>

namespace tilegen::map {

namespace {

constexpr int kDx[4] = { 1, -1, 0, 0 };
constexpr int kDy[4] = { 0, 0, 1, -1 };

inline std::size_t idx(int x, int y, int W) {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(W) + static_cast<std::size_t>(x);
}

// BFS from `start` over neighbours `accept` lets through; writes `id` into `label`.
template <typename Accept>
std::size_t fill_region(const TileMap& m, Cell start, int id, std::vector<int>& label, Accept&& accept,
                        std::vector<Cell>* out)
{
    const int W = m.width();
    std::queue<Cell> q;
    q.push(start);
    label[idx(start.x, start.y, W)] = id;
    std::size_t size = 0;

    while (!q.empty()) {
        const Cell c = q.front(); q.pop();
        ++size;
        if (out) out->push_back(c);
        for (int d = 0; d < 4; ++d) {
            const int nx = c.x + kDx[d], ny = c.y + kDy[d];
            if (!m.in_bounds(nx, ny)) continue;
            const std::size_t j = idx(nx, ny, W);
            if (label[j] != -1 || !accept(c, nx, ny)) continue;
            label[j] = id;
            q.push({nx, ny});
        }
    }
    return size;
}

template <typename Accept, typename Seed>
RegionLabels label_impl(const TileMap& m, Seed&& canSeed, Accept&& accept)
{
    RegionLabels r;
    r.label.assign(m.size(), -1);
    for (int y = 0; y < m.height(); ++y) {
        for (int x = 0; x < m.width(); ++x) {
            if (r.label[idx(x, y, m.width())] != -1 || !canSeed(x, y)) continue;
            const int id = static_cast<int>(r.sizes.size());
            r.seeds.push_back({x, y});
            r.sizes.push_back(fill_region(m, {x, y}, id, r.label, accept, nullptr));
        }
    }
    return r;
}

} // namespace

bool walkable_cell(const TileMap& m, int x, int y)
{
    return m.is_walkable(m.at(x, y));
}

int RegionLabels::largest() const noexcept
{
    int best = -1;
    std::size_t bestSize = 0;
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        if (sizes[i] > bestSize) { bestSize = sizes[i]; best = static_cast<int>(i); }
    }
    return best;
}

std::vector<Cell> flood_fill(const TileMap& m, Cell start, const CellPredicate& pred)
{
    std::vector<Cell> out;
    if (!m.in_bounds(start.x, start.y) || !pred(m, start.x, start.y))
        return out;

    std::vector<int> label(m.size(), -1);
    fill_region(m, start, 0, label,
                [&](Cell, int nx, int ny) { return pred(m, nx, ny); }, &out);
    return out;
}

RegionLabels label_regions(const TileMap& m, const CellPredicate& pred)
{
    return label_impl(m,
        [&](int x, int y) { return pred(m, x, y); },
        [&](Cell, int nx, int ny) { return pred(m, nx, ny); });
}

RegionLabels label_same_type_regions(const TileMap& m)
{
    return label_impl(m,
        [](int, int) { return true; },
        [&](Cell from, int nx, int ny) { return m.at(from.x, from.y) == m.at(nx, ny); });
}

std::size_t largest_region_size(const TileMap& m)
{
    const RegionLabels r = label_regions(m);
    const int best = r.largest();
    return best < 0 ? 0 : r.sizes[static_cast<std::size_t>(best)];
}

float connectivity_ratio(const TileMap& m)
{
    const std::size_t walkable = m.walkable_count();
    if (walkable == 0) return 0.0f;
    return static_cast<float>(largest_region_size(m)) / static_cast<float>(walkable);
}

TerrainStats compute_terrain_stats(const TileMap& m)
{
    TerrainStats s;
    s.total = m.size();
    for (int y = 0; y < m.height(); ++y)
        for (int x = 0; x < m.width(); ++x)
            ++s.counts[static_cast<std::size_t>(m.at(x, y))];

    s.walkable = m.walkable_count();
    const RegionLabels r = label_regions(m);
    s.regions = r.region_count();
    const int best = r.largest();
    s.largestRegion = best < 0 ? 0 : r.sizes[static_cast<std::size_t>(best)];
    s.connectivity = s.walkable ? static_cast<float>(s.largestRegion) / static_cast<float>(s.walkable) : 0.0f;
    return s;
}

} // namespace tilegen::map
