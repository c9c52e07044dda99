/**
 * @file CombatSystem.cpp
 * @brief Resolves attack hits against overlapping characters.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/gameplay/CombatSystem.hpp>
#include <rift/physics/CollisionEngine.hpp>
#include <rift/ecs/Registry.hpp>
#include <rift/core/Log.hpp>

#include <string>

namespace rift::gameplay {

CombatSystem::CombatSystem(const physics::CollisionEngine& collisions, CharacterConfig config) noexcept
    : _collisions{collisions},
      _machine{config},
      _descriptor{"Combat", kPriority, ecs::Archetype::of<ecs::Transform, ecs::Character>(),
                  ecs::Archetype::of<ecs::Interpolated>()}
{}

const ecs::SystemDescriptor& CombatSystem::descriptor() const noexcept
{
    return _descriptor;
}

math::AABBf CombatSystem::attackBox(const ecs::Registry& registry, ecs::EntityId attacker) const
{
    const auto& transform = *registry.getComponent<ecs::Transform>(attacker);
    const auto& character = *registry.getComponent<ecs::Character>(attacker);
    const auto& size      = _machine.config().attackSize;

    math::Vec2f origin = transform.position;
    core::f32   reach  = 0.0f;
    if (const auto* hitbox = registry.getComponent<ecs::Hitbox>(attacker))
    {
        origin += hitbox->offset;
        reach   = hitbox->size.x * 0.5f;
    }

    const core::f32 facing = static_cast<core::f32>(character.facing);
    return math::AABBf::fromCenter({origin.x + facing * (reach + size.x * 0.5f), origin.y}, size);
}

void CombatSystem::update(ecs::Registry& registry, const ecs::Query& entities, core::f32 /*dt*/)
{
    const CharacterConfig& config = _machine.config();

    for (ecs::EntityId attacker : entities)
    {
        auto& character = *registry.getComponent<ecs::Character>(attacker);
        if (character.attackConnected || !_machine.isAttackActive(character))
        {
            continue;
        }

        const math::AABBf box = attackBox(registry, attacker);
        bool hit = false;

        for (ecs::EntityId target : _collisions.queryRegion(box))
        {
            if (target == attacker || registry.hasComponent<ecs::Interpolated>(target))
            {
                continue;
            }
            auto*       victim    = registry.getComponent<ecs::Character>(target);
            const auto* transform = registry.getComponent<ecs::Transform>(target);
            const auto* hitbox    = registry.getComponent<ecs::Hitbox>(target);
            if (victim == nullptr || transform == nullptr || hitbox == nullptr)
            {
                continue;
            }
            if (!box.overlaps(physics::CollisionEngine::worldBox(*transform, *hitbox)))
            {
                continue;
            }

            const DamageResult result = applyDamage(*victim, config.attackDamage, config);
            if (result.applied)
            {
                hit = true;
                core::Log::debug("GAME", "entity " + ecs::toString(attacker) + " hit " +
                                         ecs::toString(target) + " for " +
                                         std::to_string(result.dealt) +
                                         (result.killed ? " (killed)" : ""));
            }
        }

        if (hit)
        {
            character.attackConnected = true;
        }
    }
}

} // namespace rift::gameplay
