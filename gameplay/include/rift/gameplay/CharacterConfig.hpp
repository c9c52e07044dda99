/**
 * @file CharacterConfig.hpp
 * @brief Character tuning, expressed in simulation ticks.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_GAMEPLAY_CHARACTERCONFIG_HPP
    #define RIFT_GAMEPLAY_CHARACTERCONFIG_HPP

#include <rift/math/Vec2.hpp>
#include <rift/core/Constants.hpp>
#include <rift/core/Types.hpp>

#include <cmath>

namespace rift::gameplay {

/** @brief Rounds a duration up to a whole number of ticks (at least one). */
[[nodiscard]] inline core::u32 msToTicks(core::f32 milliseconds, core::u32 tickRate) noexcept
{
    const auto ticks = static_cast<core::u32>(
        std::ceil(milliseconds * static_cast<core::f32>(tickRate) / 1000.0f - 1e-4f));
    return ticks == 0 ? 1u : ticks;
}

struct CharacterConfig
{
    core::f32   moveSpeed{core::kMoveSpeed};
    core::f32   jumpVelocity{core::kJumpVelocity};
    core::f32   dashSpeed{core::kDashSpeed};

    core::u32   dashTicks{9};
    core::u32   attackTicks{18};
    /// Attack hits during [attackActiveStart, attackActiveEnd) state ticks.
    core::u32   attackActiveStart{3};
    core::u32   attackActiveEnd{9};
    core::u32   hurtTicks{15};
    core::u32   invulnerabilityTicks{30};
    core::u32   inputBufferTicks{15};

    core::i32   attackDamage{core::kAttackDamage};
    core::i32   maxHealth{core::kDefaultMaxHealth};
    /// Attack box, placed in front of the attacker's hitbox.
    math::Vec2f attackSize{32.0f, 32.0f};

    /**
     * @brief Builds the default tuning for a given tick rate.
     * @param tickRate        Simulation ticks per second.
     * @param inputBufferMs   Action buffer window in milliseconds.
     */
    [[nodiscard]] static CharacterConfig forTickRate(core::u32 tickRate,
                                                     core::f32 inputBufferMs = core::kInputBufferWindowMs) noexcept
    {
        CharacterConfig config;
        config.dashTicks            = msToTicks(core::kDashDurationMs, tickRate);
        config.attackTicks          = msToTicks(core::kAttackDurationMs, tickRate);
        config.attackActiveStart    = msToTicks(core::kAttackActiveStartMs, tickRate);
        config.attackActiveEnd      = msToTicks(core::kAttackActiveEndMs, tickRate);
        config.hurtTicks            = msToTicks(core::kHurtDurationMs, tickRate);
        config.invulnerabilityTicks = msToTicks(core::kInvulnerabilityMs, tickRate);
        config.inputBufferTicks     = msToTicks(inputBufferMs, tickRate);
        return config;
    }
};

} // namespace rift::gameplay

#endif // RIFT_GAMEPLAY_CHARACTERCONFIG_HPP
