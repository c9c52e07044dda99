/**
 * @file CollisionDetector.hpp
 * @brief Narrow-phase collision tests.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_PHYSICS_COLLISIONDETECTOR_HPP
    #define RIFT_PHYSICS_COLLISIONDETECTOR_HPP

#include <rift/math/AABB.hpp>
#include <rift/math/Vec2.hpp>
#include <rift/core/Types.hpp>

namespace rift::physics {

/**
 * @struct ContactPoint
 * @brief Single contact between two colliding boxes.
 *
 * @c normal is the unit axis along which the first box must move to
 * separate from the second.
 */
struct ContactPoint
{
    math::Vec2f position;
    math::Vec2f normal;
    core::f32   penetrationDepth{0.0f};
};

/**
 * @struct CollisionResult
 * @brief Result of a narrow-phase test between two bodies.
 */
struct CollisionResult
{
    bool         colliding{false};
    ContactPoint contact{};
};

/**
 * @class CollisionDetector
 * @brief Stateless narrow-phase collision query functions.
 */
class CollisionDetector
{
public:
    /**
     * @brief AABB vs AABB overlap test.
     *
     * Boxes that merely touch do not collide.  The contact axis is the one
     * with the smallest overlap; X wins ties.
     *
     * @param a First bounding box.
     * @param b Second bounding box.
     * @return Collision result with contact if overlapping.
     */
    [[nodiscard]] static CollisionResult testAABBvsAABB(const math::AABBf& a,
                                                        const math::AABBf& b) noexcept;
};

} // namespace rift::physics

#endif // RIFT_PHYSICS_COLLISIONDETECTOR_HPP
