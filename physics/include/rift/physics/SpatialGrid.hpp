/**
 * @file SpatialGrid.hpp
 * @brief Uniform 2D hash grid for broad-phase collision.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_PHYSICS_SPATIALGRID_HPP
    #define RIFT_PHYSICS_SPATIALGRID_HPP

#include <rift/physics/ISpatialIndex.hpp>
#include <rift/math/Vec2.hpp>
#include <rift/core/NonCopyable.hpp>

#include <memory>

namespace rift::physics {

/**
 * @class SpatialGrid
 * @brief Fixed-cell-size hash grid.  An entity is stored in every cell its
 *        box overlaps.  O(cells) insert / remove, O(k) query.
 *
 * Rebuilt from scratch every tick by the collision engine.  The cell size
 * should be picked so an average entity spans at most four cells.
 */
class SpatialGrid final : public ISpatialIndex,
                          public core::NonCopyable<SpatialGrid>
{
public:
    /**
     * @brief Constructs a grid with the given cell size.
     * @param cellSize Side length of each square cell (> 0).
     */
    explicit SpatialGrid(core::f32 cellSize);
    ~SpatialGrid() override;

    void insert(ecs::EntityId entity, const math::AABBf& aabb) override;
    void update(ecs::EntityId entity, const math::AABBf& aabb) override;
    void remove(ecs::EntityId entity) override;

    void query(const math::AABBf& region,
               const std::function<void(ecs::EntityId)>& callback) const override;

    [[nodiscard]] std::vector<ecs::EntityId> queryRegion(const math::AABBf& region) const override;

    void clear() override;

    [[nodiscard]] core::u32 count() const noexcept override;

    /** @brief Integer cell coordinates spanned by @p aabb. */
    [[nodiscard]] std::vector<math::Vec2i> cellsFor(const math::AABBf& aabb) const;

    [[nodiscard]] core::f32 cellSize() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rift::physics

#endif // RIFT_PHYSICS_SPATIALGRID_HPP
