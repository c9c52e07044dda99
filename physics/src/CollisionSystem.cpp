/**
 * @file CollisionSystem.cpp
 * @brief ECS system driving the CollisionEngine once per tick.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/physics/CollisionSystem.hpp>
#include <rift/ecs/Registry.hpp>

namespace rift::physics {

CollisionSystem::CollisionSystem(CollisionEngine& engine) noexcept
    : _engine{engine},
      _descriptor{"Collision", kPriority, ecs::Archetype::of<ecs::Transform, ecs::Hitbox>(), {}}
{}

const ecs::SystemDescriptor& CollisionSystem::descriptor() const noexcept
{
    return _descriptor;
}

void CollisionSystem::update(ecs::Registry& registry, const ecs::Query& entities, core::f32 /*dt*/)
{
    _engine.step(registry, entities);
}

} // namespace rift::physics
