/**
 * @file CharacterStateMachine.hpp
 * @brief Table-driven character action state machine with input buffering.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_GAMEPLAY_CHARACTERSTATEMACHINE_HPP
    #define RIFT_GAMEPLAY_CHARACTERSTATEMACHINE_HPP

#include <rift/gameplay/ActionState.hpp>
#include <rift/gameplay/CharacterConfig.hpp>
#include <rift/ecs/Components.hpp>

#include <optional>
#include <span>

namespace rift::gameplay {

/**
 * @struct DamageResult
 * @brief Outcome of applyDamage.
 */
struct DamageResult
{
    bool      applied{false};
    bool      killed{false};
    core::i32 dealt{0};
};

/**
 * @class CharacterStateMachine
 * @brief Advances Character components one tick at a time.
 *
 * @par Per-tick order
 * 1. Age the action buffer, then append the actions pressed this tick.
 * 2. A timed state (Dash, Attack, Hurt) that has run its course resolves
 *    through @c Finished.
 * 3. Unless locked, the oldest buffered action whose transition is now
 *    eligible is consumed and applied (combo buffering).
 * 4. Otherwise ground and movement triggers are evaluated.
 * 5. Horizontal velocity is derived from the resulting state.
 *
 * Damage never goes through the table: applyDamage() is the only way into
 * Hurt and Dead.
 */
class CharacterStateMachine final
{
public:
    explicit CharacterStateMachine(CharacterConfig config = {}) noexcept;

    /**
     * @brief Advances one character by one tick.
     * @param character Character state to update.
     * @param transform Velocity is written according to the new state.
     * @param grounded  Whether the body touched ground at the last step.
     * @param input     Input applied this tick.
     */
    void update(ecs::Character& character, ecs::Transform& transform, bool grounded,
                const ecs::PlayerInput& input) const;

    /** @brief Looks up the transition table. */
    [[nodiscard]] std::optional<ActionState> next(ActionState from, Trigger trigger,
                                                  bool grounded) const noexcept;

    /** @brief Whether @p character's attack is inside its active window. */
    [[nodiscard]] bool isAttackActive(const ecs::Character& character) const noexcept;

    /** @brief Character at full health, idle. */
    [[nodiscard]] ecs::Character spawn() const noexcept;

    [[nodiscard]] const CharacterConfig& config() const noexcept { return _config; }

    /** @brief The transition table. */
    [[nodiscard]] static std::span<const Transition> table() noexcept;

private:
    void enter(ecs::Character& character, ecs::Transform& transform, ActionState state) const;
    [[nodiscard]] core::u32 durationOf(ActionState state) const noexcept;

    CharacterConfig _config;
};

/**
 * @brief Deals damage, clamping health to [0, maxHealth].
 *
 * Ignored while invulnerable, dead, or for non-positive amounts.  Lethal
 * damage moves the character to Dead; otherwise to Hurt with a fresh
 * invulnerability window.
 */
DamageResult applyDamage(ecs::Character& character, core::i32 amount, const CharacterConfig& config);

/** @brief Restores health up to maxHealth.  The dead stay dead. */
void heal(ecs::Character& character, core::i32 amount);

} // namespace rift::gameplay

#endif // RIFT_GAMEPLAY_CHARACTERSTATEMACHINE_HPP
