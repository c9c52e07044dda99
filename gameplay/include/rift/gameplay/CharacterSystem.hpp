/**
 * @file CharacterSystem.hpp
 * @brief ECS system running the character state machine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_GAMEPLAY_CHARACTERSYSTEM_HPP
    #define RIFT_GAMEPLAY_CHARACTERSYSTEM_HPP

#include <rift/gameplay/CharacterStateMachine.hpp>
#include <rift/ecs/System.hpp>

namespace rift::gameplay {

/**
 * @class CharacterSystem
 * @brief Feeds each character its PlayerInput and grounded flag.
 *
 * Action flags are consumed: they are cleared once read so a command
 * repeated by the server does not press the same action twice.  Entities
 * without a Body count as grounded.
 */
class CharacterSystem final : public ecs::ISystem
{
public:
    static constexpr core::i32 kPriority = 100;

    explicit CharacterSystem(CharacterConfig config = {}) noexcept;

    [[nodiscard]] const ecs::SystemDescriptor& descriptor() const noexcept override;

    void update(ecs::Registry& registry, const ecs::Query& entities, core::f32 dt) override;

    [[nodiscard]] const CharacterStateMachine& machine() const noexcept { return _machine; }

private:
    CharacterStateMachine _machine;
    ecs::SystemDescriptor _descriptor;
};

} // namespace rift::gameplay

#endif // RIFT_GAMEPLAY_CHARACTERSYSTEM_HPP
