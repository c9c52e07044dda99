/**
 * @file TestCharacterStateMachine.cpp
 * @brief Unit tests for gameplay::CharacterStateMachine and damage rules.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rift/gameplay/CharacterStateMachine.hpp"

#include <limits>

namespace rift::gameplay {

using Catch::Matchers::WithinAbs;

namespace {

struct Actor
{
    ecs::Character character;
    ecs::Transform transform;
};

ecs::PlayerInput pressed(core::u16 flags, math::Vec2f move = {})
{
    ecs::PlayerInput input;
    input.actionFlags = flags;
    input.move        = move;
    return input;
}

void idleFor(const CharacterStateMachine& machine, Actor& actor, core::u32 ticks, bool grounded = true)
{
    for (core::u32 i = 0; i < ticks; ++i)
    {
        machine.update(actor.character, actor.transform, grounded, {});
    }
}

} // namespace

TEST_CASE("Transition table lookups", "[gameplay][fsm]")
{
    const CharacterStateMachine machine;

    REQUIRE(machine.next(ActionState::Idle, Trigger::MoveInput, true) == ActionState::Move);
    REQUIRE(machine.next(ActionState::Idle, Trigger::JumpAction, true) == ActionState::Jump);
    REQUIRE_FALSE(machine.next(ActionState::Idle, Trigger::JumpAction, false).has_value());
    REQUIRE(machine.next(ActionState::Attack, Trigger::Finished, true) == ActionState::Idle);
    REQUIRE_FALSE(machine.next(ActionState::Attack, Trigger::DashAction, true).has_value());
    REQUIRE_FALSE(machine.next(ActionState::Dead, Trigger::MoveInput, true).has_value());

    for (const Transition& row : CharacterStateMachine::table())
    {
        REQUIRE(row.to != ActionState::Hurt);
        REQUIRE(row.to != ActionState::Dead);
    }
}

TEST_CASE("Animation tags", "[gameplay][fsm]")
{
    REQUIRE(toTag(ActionState::Idle) == "idle");
    REQUIRE(toTag(ActionState::Attack) == "attack");
    REQUIRE(toTag(ActionState::Dead) == "dead");
}

TEST_CASE("Default tuning converts milliseconds to ticks", "[gameplay][config]")
{
    const auto config = CharacterConfig::forTickRate(60);
    REQUIRE(config.dashTicks == 9);
    REQUIRE(config.attackTicks == 18);
    REQUIRE(config.attackActiveStart == 3);
    REQUIRE(config.attackActiveEnd == 9);
    REQUIRE(config.inputBufferTicks == 15);
    REQUIRE(msToTicks(1.0f, 60) == 1);
}

TEST_CASE("Move input drives horizontal velocity and facing", "[gameplay][fsm]")
{
    const CharacterStateMachine machine;
    Actor actor{machine.spawn(), {}};

    machine.update(actor.character, actor.transform, true, pressed(ecs::kActionNone, {-1.0f, 0.0f}));

    REQUIRE(actor.character.state == ActionState::Move);
    REQUIRE_THAT(actor.transform.velocity.x, WithinAbs(-machine.config().moveSpeed, 1e-4));
    REQUIRE(actor.character.facing == -1);

    machine.update(actor.character, actor.transform, true, {});
    REQUIRE(actor.character.state == ActionState::Idle);
    REQUIRE(actor.transform.velocity.x == 0.0f);
}

TEST_CASE("Jump requires ground and falls back down", "[gameplay][fsm]")
{
    const CharacterStateMachine machine;
    Actor actor{machine.spawn(), {}};

    machine.update(actor.character, actor.transform, true, pressed(ecs::kActionJump));
    REQUIRE(actor.character.state == ActionState::Jump);
    REQUIRE(actor.transform.velocity.y == machine.config().jumpVelocity);

    actor.transform.velocity.y = -1.0f;
    machine.update(actor.character, actor.transform, false, {});
    REQUIRE(actor.character.state == ActionState::Fall);

    machine.update(actor.character, actor.transform, true, {});
    REQUIRE(actor.character.state == ActionState::Idle);
}

TEST_CASE("Jump pressed in the air fires on landing", "[gameplay][fsm][buffer]")
{
    const CharacterStateMachine machine;
    Actor actor{machine.spawn(), {}};
    actor.transform.velocity.y = -5.0f;

    machine.update(actor.character, actor.transform, false, pressed(ecs::kActionJump));
    REQUIRE(actor.character.state == ActionState::Fall);
    REQUIRE(actor.character.actions.size() == 1);

    idleFor(machine, actor, 3, false);
    machine.update(actor.character, actor.transform, true, {});

    REQUIRE(actor.character.state == ActionState::Jump);
    REQUIRE(actor.character.actions.isEmpty());
}

TEST_CASE("Dash queued during attack recovery fires when the attack ends", "[gameplay][fsm][combo][e2e]")
{
    const CharacterStateMachine machine{CharacterConfig::forTickRate(60)};
    const auto& config = machine.config();
    Actor actor{machine.spawn(), {}};

    machine.update(actor.character, actor.transform, true, pressed(ecs::kActionAttack));
    REQUIRE(actor.character.state == ActionState::Attack);

    // Run into recovery (past the active window).
    idleFor(machine, actor, config.attackActiveEnd + 1);
    REQUIRE(actor.character.state == ActionState::Attack);
    REQUIRE_FALSE(machine.isAttackActive(actor.character));

    machine.update(actor.character, actor.transform, true, pressed(ecs::kActionDash));
    REQUIRE(actor.character.state == ActionState::Attack);

    while (actor.character.stateTicks + 1 < config.attackTicks)
    {
        machine.update(actor.character, actor.transform, true, {});
        REQUIRE(actor.character.state == ActionState::Attack);
    }

    // No new input on the tick the attack ends.
    machine.update(actor.character, actor.transform, true, {});
    REQUIRE(actor.character.state == ActionState::Dash);
    REQUIRE(actor.character.stateTicks == 0);
    REQUIRE(actor.character.actions.isEmpty());
    REQUIRE_THAT(actor.transform.velocity.x, WithinAbs(config.dashSpeed, 1e-4));
}

TEST_CASE("Buffered actions expire after the buffer window", "[gameplay][fsm][buffer]")
{
    CharacterConfig config;
    config.attackTicks     = 30;
    config.inputBufferTicks = 5;
    const CharacterStateMachine machine{config};
    Actor actor{machine.spawn(), {}};

    machine.update(actor.character, actor.transform, true, pressed(ecs::kActionAttack));
    machine.update(actor.character, actor.transform, true, pressed(ecs::kActionDash));
    REQUIRE(actor.character.actions.size() == 1);

    idleFor(machine, actor, config.inputBufferTicks);
    REQUIRE(actor.character.actions.isEmpty());

    idleFor(machine, actor, config.attackTicks);
    REQUIRE(actor.character.state == ActionState::Idle);
}

TEST_CASE("Damage clamps health and is the only path to Hurt and Dead", "[gameplay][damage]")
{
    const CharacterConfig config;
    const CharacterStateMachine machine{config};
    ecs::Character character = machine.spawn();

    auto result = applyDamage(character, 30, config);
    REQUIRE(result.applied);
    REQUIRE(character.health == config.maxHealth - 30);
    REQUIRE(character.state == ActionState::Hurt);
    REQUIRE(character.invulnerableTicks == config.invulnerabilityTicks);

    SECTION("invulnerability blocks damage")
    {
        REQUIRE_FALSE(applyDamage(character, 10, config).applied);
        REQUIRE(character.health == config.maxHealth - 30);
    }

    SECTION("lethal damage clamps at zero")
    {
        character.invulnerableTicks = 0;
        result = applyDamage(character, 1000, config);
        REQUIRE(result.killed);
        REQUIRE(result.dealt == config.maxHealth - 30);
        REQUIRE(character.health == 0);
        REQUIRE(character.state == ActionState::Dead);

        heal(character, 50);
        REQUIRE(character.health == 0);

        ecs::Transform transform;
        machine.update(character, transform, true, pressed(ecs::kActionJump, {1.0f, 0.0f}));
        REQUIRE(character.state == ActionState::Dead);
    }

    SECTION("heal clamps at max")
    {
        heal(character, 1000);
        REQUIRE(character.health == config.maxHealth);

        heal(character, std::numeric_limits<core::i32>::max());
        REQUIRE(character.health == config.maxHealth);
    }

    SECTION("negative amounts are ignored")
    {
        character.invulnerableTicks = 0;
        REQUIRE_FALSE(applyDamage(character, -5, config).applied);
        REQUIRE(character.health == config.maxHealth - 30);
    }
}

TEST_CASE("Hurt recovers to Idle", "[gameplay][damage]")
{
    const CharacterConfig config;
    const CharacterStateMachine machine{config};
    Actor actor{machine.spawn(), {}};

    (void)applyDamage(actor.character, 10, config);
    idleFor(machine, actor, config.hurtTicks - 1);
    REQUIRE(actor.character.state == ActionState::Hurt);

    idleFor(machine, actor, 1);
    REQUIRE(actor.character.state == ActionState::Idle);
}

} // namespace rift::gameplay
