/**
 * @file CombatSystem.hpp
 * @brief Resolves attack hits against overlapping characters.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_GAMEPLAY_COMBATSYSTEM_HPP
    #define RIFT_GAMEPLAY_COMBATSYSTEM_HPP

#include <rift/gameplay/CharacterStateMachine.hpp>
#include <rift/ecs/System.hpp>
#include <rift/math/AABB.hpp>

namespace rift::physics {
class CollisionEngine;
} // namespace rift::physics

namespace rift::gameplay {

/**
 * @class CombatSystem
 * @brief Runs after collision.  A character inside its attack's active
 *        window damages every other character its attack box overlaps, at
 *        most once per attack.
 *
 * Candidates come from the collision engine's grid of the current tick.
 */
class CombatSystem final : public ecs::ISystem
{
public:
    static constexpr core::i32 kPriority = 400;

    CombatSystem(const physics::CollisionEngine& collisions, CharacterConfig config = {}) noexcept;

    [[nodiscard]] const ecs::SystemDescriptor& descriptor() const noexcept override;

    void update(ecs::Registry& registry, const ecs::Query& entities, core::f32 dt) override;

    /** @brief Attack box of @p attacker, in front of its facing direction. */
    [[nodiscard]] math::AABBf attackBox(const ecs::Registry& registry, ecs::EntityId attacker) const;

private:
    const physics::CollisionEngine& _collisions;
    CharacterStateMachine           _machine;
    ecs::SystemDescriptor           _descriptor;
};

} // namespace rift::gameplay

#endif // RIFT_GAMEPLAY_COMBATSYSTEM_HPP
