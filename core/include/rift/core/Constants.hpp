/**
 * @file Constants.hpp
 * @brief Simulation-wide compile-time constants and configuration defaults.
 *
 * Every tunable that engine::Config exposes takes its default from here, so
 * that a single header documents the core's operating parameters.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RIFT_CORE_CONSTANTS_HPP
    #define RIFT_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace rift::core {

// ---- Tick ------------------------------------------------------------------

inline constexpr u32   kTickRate                  = 60;
inline constexpr f64   kFixedDeltaTime            = 1.0 / static_cast<f64>(kTickRate);

// ---- Entity store ----------------------------------------------------------

inline constexpr u32   kGenerationBits            = 12;
inline constexpr u32   kSlotBits                  = 20;
inline constexpr u32   kMaxSystems                = 64;

// ---- World -----------------------------------------------------------------

inline constexpr f32   kWorldMinX                 = 0.0f;
inline constexpr f32   kWorldMinY                 = 0.0f;
inline constexpr f32   kWorldMaxX                 = 2048.0f;
inline constexpr f32   kWorldMaxY                 = 1024.0f;
inline constexpr f32   kGravity                   = -1800.0f;
inline constexpr f32   kSpatialCellSize           = 64.0f;
inline constexpr u32   kCollisionLayerCount       = 16;

// ---- Character -------------------------------------------------------------

inline constexpr f32   kMoveSpeed                 = 240.0f;
inline constexpr f32   kJumpVelocity              = 640.0f;
inline constexpr f32   kDashSpeed                 = 720.0f;
inline constexpr f32   kDashDurationMs            = 150.0f;
inline constexpr f32   kAttackDurationMs          = 300.0f;
inline constexpr f32   kAttackActiveStartMs       = 50.0f;
inline constexpr f32   kAttackActiveEndMs         = 150.0f;
inline constexpr f32   kHurtDurationMs            = 250.0f;
inline constexpr f32   kInvulnerabilityMs         = 500.0f;
inline constexpr f32   kInputBufferWindowMs       = 250.0f;
inline constexpr i32   kAttackDamage              = 10;
inline constexpr i32   kDefaultMaxHealth          = 100;

// ---- Replication -----------------------------------------------------------

inline constexpr u16   kDefaultPort               = 7777;
inline constexpr u32   kMaxDatagramSize           = 65507;
inline constexpr u32   kMaxSessions               = 64;
inline constexpr f32   kInterpolationDelayMs      = 100.0f;
inline constexpr f32   kReconciliationEpsilon     = 0.01f;
inline constexpr u32   kFullSnapshotInterval      = 60;
inline constexpr f32   kClientTimeoutMs           = 3000.0f;
inline constexpr u32   kMalformedPacketThreshold  = 8;
inline constexpr u32   kPredictionHistorySize     = 256;
inline constexpr u32   kSnapshotHistorySize       = 64;
inline constexpr u32   kMaxBufferedInputs         = 32;

} // namespace rift::core

#endif // RIFT_CORE_CONSTANTS_HPP
