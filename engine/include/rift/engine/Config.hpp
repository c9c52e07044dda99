/**
 * @file Config.hpp
 * @brief Simulation configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_ENGINE_CONFIG_HPP
    #define RIFT_ENGINE_CONFIG_HPP

#include <rift/gameplay/CharacterConfig.hpp>
#include <rift/math/AABB.hpp>
#include <rift/core/Constants.hpp>
#include <rift/core/Expected.hpp>
#include <rift/core/Types.hpp>

#include <optional>

namespace rift::engine {

/**
 * @brief Immutable configuration shared by a World, its Server or Client
 *        and the GameLoop driving them.
 *
 * Durations are given in milliseconds and converted to ticks of the
 * configured rate on demand.
 */
class Config
{
public:
    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder& worldBounds(const math::AABBf& bounds) noexcept;
        Builder& tickRate(core::u32 hz) noexcept;
        /** @brief Tick duration above which a tick is an overrun (0 = one tick period). */
        Builder& tickBudgetMs(core::f32 ms) noexcept;
        Builder& cellSize(core::f32 size) noexcept;
        Builder& gravity(core::f32 g) noexcept;
        Builder& interpolationDelayMs(core::f32 ms) noexcept;
        Builder& reconciliationEpsilon(core::f32 epsilon) noexcept;
        Builder& inputBufferWindowMs(core::f32 ms) noexcept;
        Builder& fullSnapshotInterval(core::u32 ticks) noexcept;
        Builder& clientTimeoutMs(core::f32 ms) noexcept;
        Builder& malformedThreshold(core::u32 count) noexcept;
        Builder& predictionHistory(core::u32 entries) noexcept;
        Builder& snapshotHistory(core::u32 snapshots) noexcept;
        Builder& maxSessions(core::u32 sessions) noexcept;
        /** @brief Replaces the tuning derived from the tick rate and buffer window. */
        Builder& character(const gameplay::CharacterConfig& tuning) noexcept;

        /**
         * @brief Validates and freezes the configuration.
         * @return kInvalidArgument naming the first offending value.
         */
        [[nodiscard]] core::Expected<Config> build() const;

    private:
        math::AABBf _worldBounds{{core::kWorldMinX, core::kWorldMinY}, {core::kWorldMaxX, core::kWorldMaxY}};
        core::u32   _tickRate{core::kTickRate};
        core::f32   _tickBudgetMs{0.0f};
        core::f32   _cellSize{core::kSpatialCellSize};
        core::f32   _gravity{core::kGravity};
        core::f32   _interpolationDelayMs{core::kInterpolationDelayMs};
        core::f32   _reconciliationEpsilon{core::kReconciliationEpsilon};
        core::f32   _inputBufferWindowMs{core::kInputBufferWindowMs};
        core::u32   _fullSnapshotInterval{core::kFullSnapshotInterval};
        core::f32   _clientTimeoutMs{core::kClientTimeoutMs};
        core::u32   _malformedThreshold{core::kMalformedPacketThreshold};
        core::u32   _predictionHistory{core::kPredictionHistorySize};
        core::u32   _snapshotHistory{core::kSnapshotHistorySize};
        core::u32   _maxSessions{core::kMaxSessions};
        std::optional<gameplay::CharacterConfig> _character;
    };

    [[nodiscard]] const math::AABBf& worldBounds() const noexcept { return _worldBounds; }
    [[nodiscard]] core::u32 tickRate() const noexcept { return _tickRate; }
    [[nodiscard]] core::f32 cellSize() const noexcept { return _cellSize; }
    [[nodiscard]] core::f32 gravity() const noexcept { return _gravity; }
    [[nodiscard]] core::f32 interpolationDelayMs() const noexcept { return _interpolationDelayMs; }
    [[nodiscard]] core::f32 reconciliationEpsilon() const noexcept { return _reconciliationEpsilon; }
    [[nodiscard]] core::f32 inputBufferWindowMs() const noexcept { return _inputBufferWindowMs; }
    [[nodiscard]] core::u32 fullSnapshotInterval() const noexcept { return _fullSnapshotInterval; }
    [[nodiscard]] core::f32 clientTimeoutMs() const noexcept { return _clientTimeoutMs; }
    [[nodiscard]] core::u32 malformedThreshold() const noexcept { return _malformedThreshold; }
    [[nodiscard]] core::u32 predictionHistory() const noexcept { return _predictionHistory; }
    [[nodiscard]] core::u32 snapshotHistory() const noexcept { return _snapshotHistory; }
    [[nodiscard]] core::u32 maxSessions() const noexcept { return _maxSessions; }
    [[nodiscard]] const gameplay::CharacterConfig& character() const noexcept { return _character; }

    /** @brief Seconds per tick. */
    [[nodiscard]] core::f32 fixedDeltaTime() const noexcept;
    [[nodiscard]] core::f64 tickBudgetSeconds() const noexcept;
    [[nodiscard]] core::f64 interpolationDelaySeconds() const noexcept;
    [[nodiscard]] core::u32 clientTimeoutTicks() const noexcept;

    /** @brief Configuration with every default (always valid). */
    [[nodiscard]] static Config defaults();

private:
    friend class Builder;

    Config() = default;

    math::AABBf               _worldBounds{};
    core::u32                 _tickRate{core::kTickRate};
    core::f32                 _tickBudgetMs{0.0f};
    core::f32                 _cellSize{core::kSpatialCellSize};
    core::f32                 _gravity{core::kGravity};
    core::f32                 _interpolationDelayMs{core::kInterpolationDelayMs};
    core::f32                 _reconciliationEpsilon{core::kReconciliationEpsilon};
    core::f32                 _inputBufferWindowMs{core::kInputBufferWindowMs};
    core::u32                 _fullSnapshotInterval{core::kFullSnapshotInterval};
    core::f32                 _clientTimeoutMs{core::kClientTimeoutMs};
    core::u32                 _malformedThreshold{core::kMalformedPacketThreshold};
    core::u32                 _predictionHistory{core::kPredictionHistorySize};
    core::u32                 _snapshotHistory{core::kSnapshotHistorySize};
    core::u32                 _maxSessions{core::kMaxSessions};
    gameplay::CharacterConfig _character{};
};

} // namespace rift::engine

#endif // RIFT_ENGINE_CONFIG_HPP
