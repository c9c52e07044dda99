/**
 * @file CollisionSystem.hpp
 * @brief ECS system driving the CollisionEngine once per tick.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_PHYSICS_COLLISIONSYSTEM_HPP
    #define RIFT_PHYSICS_COLLISIONSYSTEM_HPP

#include <rift/physics/CollisionEngine.hpp>
#include <rift/ecs/System.hpp>

namespace rift::physics {

class CollisionSystem final : public ecs::ISystem
{
public:
    static constexpr core::i32 kPriority = 300;

    explicit CollisionSystem(CollisionEngine& engine) noexcept;

    [[nodiscard]] const ecs::SystemDescriptor& descriptor() const noexcept override;

    void update(ecs::Registry& registry, const ecs::Query& entities, core::f32 dt) override;

private:
    CollisionEngine&      _engine;
    ecs::SystemDescriptor _descriptor;
};

} // namespace rift::physics

#endif // RIFT_PHYSICS_COLLISIONSYSTEM_HPP
