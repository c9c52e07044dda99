/**
 * @file CollisionEngine.hpp
 * @brief Broad + narrow phase collision with solid push-apart and trigger
 *        events.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_PHYSICS_COLLISIONENGINE_HPP
    #define RIFT_PHYSICS_COLLISIONENGINE_HPP

#include <rift/physics/CollisionLayers.hpp>
#include <rift/physics/SpatialGrid.hpp>
#include <rift/ecs/Components.hpp>
#include <rift/ecs/Entity.hpp>
#include <rift/math/AABB.hpp>
#include <rift/core/NonCopyable.hpp>
#include <rift/core/Types.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace rift::ecs {
class Registry;
class Query;
} // namespace rift::ecs

namespace rift::physics {

enum class CollisionEventKind : core::u8
{
    Enter = 0,
    Stay  = 1,
    Exit  = 2
};

/**
 * @struct CollisionEvent
 * @brief Trigger overlap notification.  @c first is always the lower id.
 */
struct CollisionEvent
{
    ecs::EntityId      first;
    ecs::EntityId      second;
    CollisionEventKind kind;

    [[nodiscard]] bool operator==(const CollisionEvent&) const = default;
};

using CollisionHandler = std::function<void(const CollisionEvent&)>;

/**
 * @class CollisionEngine
 * @brief Per-tick collision pass over every entity holding
 *        Transform + Hitbox.
 *
 * @par Algorithm
 * 1. Rebuild the spatial grid from current transforms.
 * 2. Query each entity's own box; keep pairs (lower id, higher id) whose
 *    layers collide.  Pairs are processed in ascending order.
 * 3. Narrow phase: strict AABB overlap.  Solid/solid pairs are pushed apart
 *    along the minimum axis, split by inverse mass.  Any pair involving a
 *    trigger only produces Enter/Stay/Exit events.
 * 4. Events are dispatched once, after every pair has been resolved.
 */
class CollisionEngine final : public core::NonCopyable<CollisionEngine>
{
public:
    /**
     * @brief Constructs an engine with the broad-phase cell size.
     * @param cellSize Spatial grid cell side length.
     */
    explicit CollisionEngine(core::f32 cellSize);
    ~CollisionEngine();

    /** @brief Runs one collision pass over every Transform + Hitbox entity. */
    void step(ecs::Registry& registry);

    /** @brief Runs one collision pass over @p entities. */
    void step(ecs::Registry& registry, const ecs::Query& entities);

    /** @brief Registers a handler invoked for each dispatched event. */
    void onEvent(CollisionHandler handler);

    /** @brief While muted, events are still computed but handlers are not called. */
    void setEventsMuted(bool muted) noexcept;
    [[nodiscard]] bool eventsMuted() const noexcept;

    /** @brief Events produced by the last step, in dispatch order. */
    [[nodiscard]] const std::vector<CollisionEvent>& lastEvents() const noexcept;

    /** @brief Entities whose box touched @p region at the last step. */
    [[nodiscard]] std::vector<ecs::EntityId> queryRegion(const math::AABBf& region) const;

    /** @brief Forgets trigger overlap state (next overlaps report Enter). */
    void resetContacts();

    [[nodiscard]] CollisionLayers&       layers() noexcept;
    [[nodiscard]] const CollisionLayers& layers() const noexcept;

    [[nodiscard]] const SpatialGrid& grid() const noexcept;

    /** @brief World-space box of a hitbox attached to @p transform. */
    [[nodiscard]] static math::AABBf worldBox(const ecs::Transform& transform,
                                              const ecs::Hitbox& hitbox) noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rift::physics

#endif // RIFT_PHYSICS_COLLISIONENGINE_HPP
