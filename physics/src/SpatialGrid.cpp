/**
 * @file SpatialGrid.cpp
 * @brief Uniform 2D hash grid implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/physics/SpatialGrid.hpp>
#include <rift/core/Assert.hpp>

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rift::physics {

struct SpatialGrid::Impl
{
    core::f32                                                cellSize;
    std::unordered_map<core::u64, std::vector<ecs::EntityId>> cells;
    std::unordered_map<ecs::EntityId, math::AABBf>           objects;

    explicit Impl(core::f32 cs) : cellSize{cs} {}

    [[nodiscard]] core::i32 toCell(core::f32 v) const
    {
        return static_cast<core::i32>(std::floor(v / cellSize));
    }

    [[nodiscard]] static core::u64 cellKey(core::i32 cx, core::i32 cy)
    {
        return (static_cast<core::u64>(static_cast<core::u32>(cx)) << 32)
             | static_cast<core::u64>(static_cast<core::u32>(cy));
    }

    template <typename Fn>
    void forEachCell(const math::AABBf& aabb, Fn&& fn) const
    {
        const core::i32 minCx = toCell(aabb.min.x);
        const core::i32 minCy = toCell(aabb.min.y);
        const core::i32 maxCx = toCell(aabb.max.x);
        const core::i32 maxCy = toCell(aabb.max.y);

        for (core::i32 cx = minCx; cx <= maxCx; ++cx)
        {
            for (core::i32 cy = minCy; cy <= maxCy; ++cy)
            {
                fn(cx, cy);
            }
        }
    }

    void insertCells(ecs::EntityId entity, const math::AABBf& aabb)
    {
        forEachCell(aabb, [&](core::i32 cx, core::i32 cy) {
            cells[cellKey(cx, cy)].push_back(entity);
        });
    }

    void removeCells(ecs::EntityId entity, const math::AABBf& aabb)
    {
        forEachCell(aabb, [&](core::i32 cx, core::i32 cy) {
            auto it = cells.find(cellKey(cx, cy));
            if (it == cells.end())
            {
                return;
            }
            std::erase(it->second, entity);
            if (it->second.empty())
            {
                cells.erase(it);
            }
        });
    }
};

SpatialGrid::SpatialGrid(core::f32 cellSize)
    : _impl{std::make_unique<Impl>(cellSize)}
{
    RIFT_ASSERT(cellSize > 0.0f);
}

SpatialGrid::~SpatialGrid() = default;

void SpatialGrid::insert(ecs::EntityId entity, const math::AABBf& aabb)
{
    update(entity, aabb);
}

void SpatialGrid::update(ecs::EntityId entity, const math::AABBf& aabb)
{
    auto it = _impl->objects.find(entity);
    if (it != _impl->objects.end())
    {
        _impl->removeCells(entity, it->second);
    }
    _impl->objects[entity] = aabb;
    _impl->insertCells(entity, aabb);
}

void SpatialGrid::remove(ecs::EntityId entity)
{
    auto it = _impl->objects.find(entity);
    if (it == _impl->objects.end())
    {
        return;
    }
    _impl->removeCells(entity, it->second);
    _impl->objects.erase(it);
}

void SpatialGrid::query(const math::AABBf& region,
                        const std::function<void(ecs::EntityId)>& callback) const
{
    std::unordered_set<ecs::EntityId> visited;

    _impl->forEachCell(region, [&](core::i32 cx, core::i32 cy) {
        auto it = _impl->cells.find(Impl::cellKey(cx, cy));
        if (it == _impl->cells.end())
        {
            return;
        }
        for (ecs::EntityId id : it->second)
        {
            if (visited.insert(id).second && _impl->objects.at(id).intersects(region))
            {
                callback(id);
            }
        }
    });
}

std::vector<ecs::EntityId> SpatialGrid::queryRegion(const math::AABBf& region) const
{
    std::vector<ecs::EntityId> result;
    query(region, [&result](ecs::EntityId id) { result.push_back(id); });
    std::ranges::sort(result);
    return result;
}

void SpatialGrid::clear()
{
    _impl->cells.clear();
    _impl->objects.clear();
}

core::u32 SpatialGrid::count() const noexcept
{
    return static_cast<core::u32>(_impl->objects.size());
}

std::vector<math::Vec2i> SpatialGrid::cellsFor(const math::AABBf& aabb) const
{
    std::vector<math::Vec2i> result;
    _impl->forEachCell(aabb, [&result](core::i32 cx, core::i32 cy) {
        result.emplace_back(cx, cy);
    });
    return result;
}

core::f32 SpatialGrid::cellSize() const noexcept
{
    return _impl->cellSize;
}

} // namespace rift::physics
