/**
 * @file CharacterStateMachine.cpp
 * @brief Transition table, action buffer handling and damage rules.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/gameplay/CharacterStateMachine.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace rift::gameplay {

namespace {

using enum ecs::ActionState;

constexpr std::array kTransitions = {
    Transition{Idle,   Trigger::MoveInput,    Move,   false},
    Transition{Idle,   Trigger::JumpAction,   Jump,   true },
    Transition{Idle,   Trigger::DashAction,   Dash,   false},
    Transition{Idle,   Trigger::AttackAction, Attack, false},
    Transition{Idle,   Trigger::Airborne,     Fall,   false},

    Transition{Move,   Trigger::NoMoveInput,  Idle,   false},
    Transition{Move,   Trigger::JumpAction,   Jump,   true },
    Transition{Move,   Trigger::DashAction,   Dash,   false},
    Transition{Move,   Trigger::AttackAction, Attack, false},
    Transition{Move,   Trigger::Airborne,     Fall,   false},

    Transition{Jump,   Trigger::Falling,      Fall,   false},
    Transition{Jump,   Trigger::Landed,       Idle,   true },
    Transition{Jump,   Trigger::DashAction,   Dash,   false},
    Transition{Jump,   Trigger::AttackAction, Attack, false},

    Transition{Fall,   Trigger::Landed,       Idle,   true },
    Transition{Fall,   Trigger::JumpAction,   Jump,   true },
    Transition{Fall,   Trigger::DashAction,   Dash,   false},
    Transition{Fall,   Trigger::AttackAction, Attack, false},

    Transition{Dash,   Trigger::Finished,     Idle,   false},
    Transition{Attack, Trigger::Finished,     Idle,   false},
    Transition{Hurt,   Trigger::Finished,     Idle,   false},
};

constexpr std::array kActions = {ecs::kActionJump, ecs::kActionDash, ecs::kActionAttack};

} // namespace

CharacterStateMachine::CharacterStateMachine(CharacterConfig config) noexcept
    : _config{config}
{}

std::span<const Transition> CharacterStateMachine::table() noexcept
{
    return kTransitions;
}

std::optional<ActionState> CharacterStateMachine::next(ActionState from, Trigger trigger,
                                                       bool grounded) const noexcept
{
    for (const Transition& row : kTransitions)
    {
        if (row.from == from && row.trigger == trigger && (!row.requiresGrounded || grounded))
        {
            return row.to;
        }
    }
    return std::nullopt;
}

void CharacterStateMachine::update(ecs::Character& character, ecs::Transform& transform,
                                   bool grounded, const ecs::PlayerInput& input) const
{
    ++character.stateTicks;
    if (character.invulnerableTicks > 0)
    {
        --character.invulnerableTicks;
    }

    // ---- 1. Action buffer ------------------------------------------------
    auto& buffer = character.actions;
    for (core::usize i = buffer.size(); i-- > 0;)
    {
        if (buffer[i].ticksLeft <= 1)
            buffer.eraseAt(i);
        else
            --buffer[i].ticksLeft;
    }
    for (auto action : kActions)
    {
        if (input.actionFlags & action)
        {
            buffer.push(ecs::BufferedAction{static_cast<core::u16>(action), _config.inputBufferTicks});
        }
    }

    if (character.state == Dead)
    {
        buffer.clear();
        transform.velocity.x = 0.0f;
        return;
    }

    const bool wantsMove = std::abs(input.move.x) > 1e-3f;

    // ---- 2. Timed states ---------------------------------------------------
    if (isLocked(character.state))
    {
        if (character.stateTicks < durationOf(character.state))
        {
            if (character.state == Dash)
                transform.velocity.x = static_cast<core::f32>(character.facing) * _config.dashSpeed;
            else
                transform.velocity.x = 0.0f;
            return;
        }
        if (auto to = next(character.state, Trigger::Finished, grounded))
        {
            enter(character, transform, *to);
        }
    }

    // ---- 3. Buffered actions -----------------------------------------------
    bool consumed = false;
    for (core::usize i = 0; i < buffer.size(); ++i)
    {
        const auto action = static_cast<ecs::ActionFlag>(buffer[i].action);
        if (auto to = next(character.state, triggerFor(action), grounded))
        {
            buffer.eraseAt(i);
            enter(character, transform, *to);
            consumed = true;
            break;
        }
    }

    // ---- 4. Ground and movement --------------------------------------------
    if (!consumed)
    {
        std::optional<ActionState> to;
        if (grounded)
        {
            if (transform.velocity.y <= 0.0f)
                to = next(character.state, Trigger::Landed, grounded);
        }
        else
        {
            if (transform.velocity.y <= 0.0f)
                to = next(character.state, Trigger::Falling, grounded);
            if (!to)
                to = next(character.state, Trigger::Airborne, grounded);
        }

        if (!to)
            to = next(character.state, wantsMove ? Trigger::MoveInput : Trigger::NoMoveInput, grounded);

        if (to)
            enter(character, transform, *to);
    }

    // ---- 5. Locomotion -----------------------------------------------------
    switch (character.state)
    {
        case Dash:
            transform.velocity.x = static_cast<core::f32>(character.facing) * _config.dashSpeed;
            break;
        case Attack:
        case Hurt:
        case Dead:
            transform.velocity.x = 0.0f;
            break;
        default:
            transform.velocity.x = std::clamp(input.move.x, -1.0f, 1.0f) * _config.moveSpeed;
            if (wantsMove)
                character.facing = input.move.x > 0.0f ? 1 : -1;
            break;
    }
}

void CharacterStateMachine::enter(ecs::Character& character, ecs::Transform& transform,
                                  ActionState state) const
{
    character.state      = state;
    character.stateTicks = 0;

    switch (state)
    {
        case Jump:
            transform.velocity.y = _config.jumpVelocity;
            break;
        case Dash:
            transform.velocity.y = 0.0f;
            break;
        case Attack:
            character.attackConnected = false;
            break;
        default:
            break;
    }
}

core::u32 CharacterStateMachine::durationOf(ActionState state) const noexcept
{
    switch (state)
    {
        case Dash:   return _config.dashTicks;
        case Attack: return _config.attackTicks;
        case Hurt:   return _config.hurtTicks;
        default:     return 0;
    }
}

bool CharacterStateMachine::isAttackActive(const ecs::Character& character) const noexcept
{
    return character.state == Attack
        && character.stateTicks >= _config.attackActiveStart
        && character.stateTicks < _config.attackActiveEnd;
}

ecs::Character CharacterStateMachine::spawn() const noexcept
{
    ecs::Character character;
    character.health    = _config.maxHealth;
    character.maxHealth = _config.maxHealth;
    return character;
}

DamageResult applyDamage(ecs::Character& character, core::i32 amount, const CharacterConfig& config)
{
    DamageResult result;
    if (amount <= 0 || character.state == Dead || character.invulnerableTicks > 0)
    {
        return result;
    }

    const core::i32 before = character.health;
    character.health = std::clamp(character.health - amount, 0, character.maxHealth);

    result.applied = true;
    result.dealt   = before - character.health;

    character.stateTicks = 0;
    character.actions.clear();
    if (character.health == 0)
    {
        character.state = Dead;
        result.killed   = true;
    }
    else
    {
        character.state             = Hurt;
        character.invulnerableTicks = config.invulnerabilityTicks;
    }
    return result;
}

void heal(ecs::Character& character, core::i32 amount)
{
    if (amount <= 0 || character.state == Dead)
    {
        return;
    }
    const core::i32 missing = std::max(character.maxHealth - character.health, 0);
    character.health += std::min(amount, missing);
}

} // namespace rift::gameplay
