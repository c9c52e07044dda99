/**
 * @file ISpatialIndex.hpp
 * @brief Abstract spatial index interface for broad-phase queries.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_PHYSICS_ISPATIALINDEX_HPP
    #define RIFT_PHYSICS_ISPATIALINDEX_HPP

#include <rift/ecs/Entity.hpp>
#include <rift/math/AABB.hpp>
#include <rift/core/Types.hpp>

#include <functional>
#include <vector>

namespace rift::physics {

/**
 * @class ISpatialIndex
 * @brief Strategy interface for spatial acceleration structures.
 *
 * Queries over-approximate: an entity whose box touches the region is
 * always reported.
 */
class ISpatialIndex
{
public:
    virtual ~ISpatialIndex() = default;

    /**
     * @brief Inserts an entity with the given AABB.
     * @param entity Entity identifier.
     * @param aabb   World-space axis-aligned bounding box.
     */
    virtual void insert(ecs::EntityId entity, const math::AABBf& aabb) = 0;

    /** @brief Updates the AABB of an already-inserted entity (inserts if unknown). */
    virtual void update(ecs::EntityId entity, const math::AABBf& aabb) = 0;

    /** @brief Removes an entity from the index.  Unknown ids are ignored. */
    virtual void remove(ecs::EntityId entity) = 0;

    /**
     * @brief Visits every entity whose AABB touches the given region.
     * @param region   Query AABB.
     * @param callback Called once per entity.
     */
    virtual void query(const math::AABBf& region,
                       const std::function<void(ecs::EntityId)>& callback) const = 0;

    /** @brief Candidates touching @p region, ascending and deduplicated. */
    [[nodiscard]] virtual std::vector<ecs::EntityId> queryRegion(const math::AABBf& region) const = 0;

    /** @brief Drops every entity. */
    virtual void clear() = 0;

    /** @brief Returns the total number of tracked entities. */
    [[nodiscard]] virtual core::u32 count() const noexcept = 0;
};

} // namespace rift::physics

#endif // RIFT_PHYSICS_ISPATIALINDEX_HPP
