/**
 * @file MovementSystem.hpp
 * @brief Gravity, velocity integration and world-bounds clamping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_PHYSICS_MOVEMENTSYSTEM_HPP
    #define RIFT_PHYSICS_MOVEMENTSYSTEM_HPP

#include <rift/ecs/System.hpp>
#include <rift/math/AABB.hpp>
#include <rift/core/Constants.hpp>

namespace rift::physics {

struct MovementSettings
{
    core::f32   gravity{core::kGravity};
    math::AABBf worldBounds{{core::kWorldMinX, core::kWorldMinY}, {core::kWorldMaxX, core::kWorldMaxY}};
};

/**
 * @class MovementSystem
 * @brief Integrates every simulated Transform.
 *
 * Entities with a Body fall under gravity (scaled by @c gravityScale) and
 * have @c grounded recomputed each tick; static bodies never move.
 * Interpolated entities are skipped: their transforms come from snapshots.
 * The bottom world edge acts as ground.
 */
class MovementSystem final : public ecs::ISystem
{
public:
    static constexpr core::i32 kPriority = 200;

    explicit MovementSystem(MovementSettings settings = {}) noexcept;

    [[nodiscard]] const ecs::SystemDescriptor& descriptor() const noexcept override;

    void update(ecs::Registry& registry, const ecs::Query& entities, core::f32 dt) override;

private:
    MovementSettings      _settings;
    ecs::SystemDescriptor _descriptor;
};

} // namespace rift::physics

#endif // RIFT_PHYSICS_MOVEMENTSYSTEM_HPP
