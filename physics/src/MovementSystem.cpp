/**
 * @file MovementSystem.cpp
 * @brief Gravity, velocity integration and world-bounds clamping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/physics/MovementSystem.hpp>
#include <rift/physics/CollisionEngine.hpp>
#include <rift/ecs/Registry.hpp>

#include <algorithm>

namespace rift::physics {

MovementSystem::MovementSystem(MovementSettings settings) noexcept
    : _settings{settings},
      _descriptor{"Movement", kPriority, ecs::Archetype::of<ecs::Transform>(),
                  ecs::Archetype::of<ecs::Interpolated>()}
{}

const ecs::SystemDescriptor& MovementSystem::descriptor() const noexcept
{
    return _descriptor;
}

void MovementSystem::update(ecs::Registry& registry, const ecs::Query& entities, core::f32 dt)
{
    const math::AABBf& bounds = _settings.worldBounds;

    for (ecs::EntityId id : entities)
    {
        auto& transform = *registry.getComponent<ecs::Transform>(id);
        auto* body      = registry.getComponent<ecs::Body>(id);

        if (body != nullptr)
        {
            if (body->isStatic)
            {
                continue;
            }
            body->grounded = false;
            transform.velocity.y += _settings.gravity * body->gravityScale * dt;
        }

        transform.position += transform.velocity * dt;

        // Keep the whole hitbox (or the point) inside the world.
        math::AABBf box{transform.position, transform.position};
        if (const auto* hitbox = registry.getComponent<ecs::Hitbox>(id))
        {
            box = CollisionEngine::worldBox(transform, *hitbox);
        }

        if (box.min.x < bounds.min.x)
        {
            transform.position.x += bounds.min.x - box.min.x;
            transform.velocity.x = std::max(transform.velocity.x, 0.0f);
        }
        else if (box.max.x > bounds.max.x)
        {
            transform.position.x -= box.max.x - bounds.max.x;
            transform.velocity.x = std::min(transform.velocity.x, 0.0f);
        }

        if (box.min.y <= bounds.min.y)
        {
            transform.position.y += bounds.min.y - box.min.y;
            transform.velocity.y = std::max(transform.velocity.y, 0.0f);
            if (body != nullptr)
            {
                body->grounded = true;
            }
        }
        else if (box.max.y > bounds.max.y)
        {
            transform.position.y -= box.max.y - bounds.max.y;
            transform.velocity.y = std::min(transform.velocity.y, 0.0f);
        }
    }
}

} // namespace rift::physics
