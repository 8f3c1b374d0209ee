#include "tilegen/placement/EntityPlacer.hpp"
#include "tilegen/pcg/Rng.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace tilegen::placement {

using entities::Entity;
using entities::EntityType;
using entities::Vec2f;
using map::Cell;
using map::TileMap;

namespace {

Vec2f to_pos(const Cell& c) {
    return { static_cast<float>(c.x), static_cast<float>(c.y) };
}

// Shared state for one place_entities() call.
struct Placement {
    const TileMap& tiles;
    const config::EntityConfig& request;
    const std::vector<Cell>& walkable;
    const std::vector<Entity>& placed;
    const EntityPlacer& placer;
    pcg::IRandomSource& rng;
    const std::string& strategy; // lower-case

    const Entity& player() const { return placed.front(); }

    // One entity per tile whatever the requested spacing.
    bool acceptable(Vec2f p) const {
        const float minDistance = std::max(config::kDefaultMinDistance, request.effective_min_distance());
        return placer.is_valid_position(p, tiles, placed, minDistance) &&
               entities::distance(p, player().position) <= request.maxDistanceFromPlayer;
    }

    std::vector<Vec2f> candidates() const {
        std::vector<Vec2f> out;
        for (const Cell& c : walkable) {
            const Vec2f p = to_pos(c);
            if (acceptable(p)) out.push_back(p);
        }
        return out;
    }

    std::optional<Vec2f> pick(const std::vector<Vec2f>& v) const {
        if (v.empty()) return std::nullopt;
        return v[static_cast<std::size_t>(rng.next_int(0, static_cast<int>(v.size())))];
    }

    // Random choice among the best quarter by `metric` (lower is better).
    template <class Metric>
    std::optional<Vec2f> pick_best_quarter(std::vector<Vec2f> v, Metric metric) const {
        if (v.empty()) return std::nullopt;
        std::stable_sort(v.begin(), v.end(), [&](Vec2f a, Vec2f b) { return metric(a) < metric(b); });
        const std::size_t top = std::max<std::size_t>(1, v.size() / 4);
        return v[static_cast<std::size_t>(rng.next_int(0, static_cast<int>(top)))];
    }

    std::optional<Vec2f> random() const {
        const std::size_t freeTiles = walkable.size() > placed.size() ? walkable.size() - placed.size() : 0;
        const std::size_t budget = EntityPlacer::attempt_budget(freeTiles);
        for (std::size_t i = 0; i < budget; ++i) {
            const Vec2f p = to_pos(walkable[static_cast<std::size_t>(
                rng.next_int(0, static_cast<int>(walkable.size())))]);
            if (acceptable(p)) return p;
        }
        return std::nullopt;
    }

    std::optional<Vec2f> clustered() const {
        std::vector<Vec2f> v;
        for (const Vec2f& p : candidates()) {
            for (const Entity& e : placed) {
                if (e.type == request.type &&
                    std::abs(e.position.x - p.x) <= EntityPlacer::kClusterRadius &&
                    std::abs(e.position.y - p.y) <= EntityPlacer::kClusterRadius) {
                    v.push_back(p);
                    break;
                }
            }
        }
        return pick(v);
    }

    std::optional<Vec2f> spread() const {
        return pick_best_quarter(candidates(), [&](Vec2f p) {
            float nearest = std::numeric_limits<float>::max();
            for (const Entity& e : placed) nearest = std::min(nearest, entities::distance(p, e.position));
            return -nearest;
        });
    }

    std::optional<Vec2f> near_walls() const {
        std::vector<Vec2f> v;
        for (const Vec2f& p : candidates()) {
            const int x = static_cast<int>(p.x), y = static_cast<int>(p.y);
            bool nearWall = false;
            for (int dy=-1; dy<=1 && !nearWall; ++dy)
                for (int dx=-1; dx<=1 && !nearWall; ++dx)
                    if ((dx || dy) && tiles.in_bounds(x+dx, y+dy) && !tiles.is_walkable(x+dx, y+dy))
                        nearWall = true;
            if (nearWall) v.push_back(p);
        }
        return pick(v);
    }

    std::optional<Vec2f> center() const {
        const Vec2f c{ tiles.width() / 2.0f, tiles.height() / 2.0f };
        return pick_best_quarter(candidates(), [&](Vec2f p) { return entities::distance(p, c); });
    }

    std::optional<Vec2f> far_from_player() const {
        const Vec2f pp = player().position;
        return pick_best_quarter(candidates(), [&](Vec2f p) { return -entities::distance(p, pp); });
    }

    std::optional<Vec2f> corners() const {
        const float w = static_cast<float>(tiles.width()), h = static_cast<float>(tiles.height());
        const Vec2f anchors[4] = {
            { w * 0.25f, h * 0.25f }, { w * 0.75f, h * 0.25f },
            { w * 0.25f, h * 0.75f }, { w * 0.75f, h * 0.75f },
        };
        const float radius = std::min(w, h) * EntityPlacer::kCornerRadiusFraction;
        std::vector<Vec2f> v;
        for (const Vec2f& p : candidates()) {
            for (const Vec2f& a : anchors) {
                if (entities::distance(p, a) <= radius) { v.push_back(p); break; }
            }
        }
        return pick(v);
    }

    std::optional<Vec2f> choose() const {
        const std::string& s = strategy;
        std::optional<Vec2f> p;
        if      (s == "clustered")       p = clustered();
        else if (s == "spread")          p = spread();
        else if (s == "near_walls")      p = near_walls();
        else if (s == "center")          p = center();
        else if (s == "far_from_player") p = far_from_player();
        else if (s == "corners")         p = corners();
        return p ? p : random();
    }
};

} // namespace

std::size_t EntityPlacer::attempt_budget(std::size_t freeTiles) noexcept
{
    return std::max<std::size_t>(1, std::min(4 * freeTiles, kMaxAttempts));
}

bool EntityPlacer::is_valid_position(Vec2f pos, const TileMap& m,
                                     const std::vector<Entity>& others, float minDistance) const
{
    const int x = static_cast<int>(std::floor(pos.x));
    const int y = static_cast<int>(std::floor(pos.y));
    if (!m.in_bounds(x, y) || !m.is_walkable(x, y))
        return false;
    for (const Entity& e : others)
        if (entities::distance(pos, e.position) < minDistance)
            return false;
    return true;
}

std::vector<Entity> EntityPlacer::place_entities(const TileMap& m, const config::GenerationConfig& cfg, uint64_t seed)
{
    pcg::Rng rng(seed);
    return place_entities(m, cfg, rng);
}

std::vector<Entity> EntityPlacer::place_entities(const TileMap& m, const config::GenerationConfig& cfg,
                                                 pcg::IRandomSource& rng)
{
    std::vector<Entity> placed;

    std::vector<Cell> walkable;
    for (int y = 0; y < m.height(); ++y)
        for (int x = 0; x < m.width(); ++x)
            if (m.is_walkable(m.at(x, y)))
                walkable.push_back({ x, y });

    if (walkable.empty()) {
        spdlog::warn("placement: {}x{} map has no walkable tiles, nothing placed", m.width(), m.height());
        return placed;
    }

    uint32_t nextId = 1;
    const Cell start = walkable[static_cast<std::size_t>(rng.next_int(0, static_cast<int>(walkable.size())))];
    placed.push_back({ nextId++, EntityType::Player, to_pos(start), {} });

    const auto& strategies = config::known_placement_strategies();
    for (const config::EntityConfig& req : cfg.entities) {
        std::string strategy = req.placementStrategy;
        std::transform(strategy.begin(), strategy.end(), strategy.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (std::find(strategies.begin(), strategies.end(), strategy) == strategies.end())
            spdlog::warn("placement: unknown strategy '{}' for {}, using random",
                         req.placementStrategy, entities::entity_type_name(req.type));

        const int wanted = req.effective_count();
        int got = 0;
        for (int i = 0; i < wanted; ++i) {
            const Placement ctx{ m, req, walkable, placed, *this, rng, strategy };
            const std::optional<Vec2f> p = ctx.choose();
            if (!p) continue;
            placed.push_back({ nextId++, req.type, *p, req.properties });
            ++got;
        }
        if (got < wanted)
            spdlog::warn("placement: placed {}/{} {} (strategy {}, minDistance {})",
                         got, wanted, entities::entity_type_name(req.type),
                         req.placementStrategy, req.effective_min_distance());
        else
            spdlog::debug("placement: placed {} {}", got, entities::entity_type_name(req.type));
    }

    spdlog::info("placement: {} entities on {} walkable tiles", placed.size(), walkable.size());
    return placed;
}

} // namespace tilegen::placement
