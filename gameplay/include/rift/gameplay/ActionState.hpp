/**
 * @file ActionState.hpp
 * @brief Character action states, transition triggers and the transition
 *        table row type.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_GAMEPLAY_ACTIONSTATE_HPP
    #define RIFT_GAMEPLAY_ACTIONSTATE_HPP

#include <rift/ecs/Components.hpp>
#include <rift/core/Types.hpp>

#include <string_view>

namespace rift::gameplay {

using ecs::ActionState;

/** @brief Conditions evaluated each tick that may move a character. */
enum class Trigger : core::u8
{
    MoveInput,
    NoMoveInput,
    JumpAction,
    DashAction,
    AttackAction,
    /// Left the ground without jumping.
    Airborne,
    /// Airborne with non-positive vertical velocity.
    Falling,
    Landed,
    /// Timed state ran out.
    Finished,
};

struct Transition
{
    ActionState from;
    Trigger     trigger;
    ActionState to;
    bool        requiresGrounded{false};
};

/** @brief Animation tag handed to the renderer. */
[[nodiscard]] constexpr std::string_view toTag(ActionState state) noexcept
{
    switch (state)
    {
        case ActionState::Idle:   return "idle";
        case ActionState::Move:   return "move";
        case ActionState::Jump:   return "jump";
        case ActionState::Fall:   return "fall";
        case ActionState::Dash:   return "dash";
        case ActionState::Attack: return "attack";
        case ActionState::Hurt:   return "hurt";
        case ActionState::Dead:   return "dead";
        case ActionState::Count:  break;
    }
    return "unknown";
}

/** @brief Timed states ignore input until they finish. */
[[nodiscard]] constexpr bool isLocked(ActionState state) noexcept
{
    return state == ActionState::Dash || state == ActionState::Attack || state == ActionState::Hurt;
}

/** @brief Trigger raised by a buffered action flag. */
[[nodiscard]] constexpr Trigger triggerFor(ecs::ActionFlag action) noexcept
{
    switch (action)
    {
        case ecs::kActionJump:   return Trigger::JumpAction;
        case ecs::kActionDash:   return Trigger::DashAction;
        default:                 return Trigger::AttackAction;
    }
}

} // namespace rift::gameplay

#endif // RIFT_GAMEPLAY_ACTIONSTATE_HPP
