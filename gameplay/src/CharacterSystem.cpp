/**
 * @file CharacterSystem.cpp
 * @brief ECS system running the character state machine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/gameplay/CharacterSystem.hpp>
#include <rift/ecs/Registry.hpp>

namespace rift::gameplay {

CharacterSystem::CharacterSystem(CharacterConfig config) noexcept
    : _machine{config},
      _descriptor{"Character", kPriority, ecs::Archetype::of<ecs::Transform, ecs::Character>(),
                  ecs::Archetype::of<ecs::Interpolated>()}
{}

const ecs::SystemDescriptor& CharacterSystem::descriptor() const noexcept
{
    return _descriptor;
}

void CharacterSystem::update(ecs::Registry& registry, const ecs::Query& entities, core::f32 /*dt*/)
{
    for (ecs::EntityId id : entities)
    {
        auto& character = *registry.getComponent<ecs::Character>(id);
        auto& transform = *registry.getComponent<ecs::Transform>(id);

        const auto* body     = registry.getComponent<ecs::Body>(id);
        const bool  grounded = body == nullptr || body->grounded;

        ecs::PlayerInput input{};
        if (auto* pending = registry.getComponent<ecs::PlayerInput>(id))
        {
            input                 = *pending;
            pending->actionFlags  = ecs::kActionNone;
        }

        _machine.update(character, transform, grounded, input);
    }
}

} // namespace rift::gameplay
