/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/engine/Config.hpp>

#include <cmath>
#include <string>

namespace rift::engine {

namespace {

[[nodiscard]] auto invalid(const std::string& what)
{
    return core::makeError(core::ErrorCode::kInvalidArgument, "Invalid config: " + what);
}

} // namespace

Config::Builder& Config::Builder::worldBounds(const math::AABBf& bounds) noexcept
{
    _worldBounds = bounds;
    return *this;
}

Config::Builder& Config::Builder::tickRate(core::u32 hz) noexcept
{
    _tickRate = hz;
    return *this;
}

Config::Builder& Config::Builder::tickBudgetMs(core::f32 ms) noexcept
{
    _tickBudgetMs = ms;
    return *this;
}

Config::Builder& Config::Builder::cellSize(core::f32 size) noexcept
{
    _cellSize = size;
    return *this;
}

Config::Builder& Config::Builder::gravity(core::f32 g) noexcept
{
    _gravity = g;
    return *this;
}

Config::Builder& Config::Builder::interpolationDelayMs(core::f32 ms) noexcept
{
    _interpolationDelayMs = ms;
    return *this;
}

Config::Builder& Config::Builder::reconciliationEpsilon(core::f32 epsilon) noexcept
{
    _reconciliationEpsilon = epsilon;
    return *this;
}

Config::Builder& Config::Builder::inputBufferWindowMs(core::f32 ms) noexcept
{
    _inputBufferWindowMs = ms;
    return *this;
}

Config::Builder& Config::Builder::fullSnapshotInterval(core::u32 ticks) noexcept
{
    _fullSnapshotInterval = ticks;
    return *this;
}

Config::Builder& Config::Builder::clientTimeoutMs(core::f32 ms) noexcept
{
    _clientTimeoutMs = ms;
    return *this;
}

Config::Builder& Config::Builder::malformedThreshold(core::u32 count) noexcept
{
    _malformedThreshold = count;
    return *this;
}

Config::Builder& Config::Builder::predictionHistory(core::u32 entries) noexcept
{
    _predictionHistory = entries;
    return *this;
}

Config::Builder& Config::Builder::snapshotHistory(core::u32 snapshots) noexcept
{
    _snapshotHistory = snapshots;
    return *this;
}

Config::Builder& Config::Builder::maxSessions(core::u32 sessions) noexcept
{
    _maxSessions = sessions;
    return *this;
}

Config::Builder& Config::Builder::character(const gameplay::CharacterConfig& tuning) noexcept
{
    _character = tuning;
    return *this;
}

core::Expected<Config> Config::Builder::build() const
{
    if (_tickRate == 0 || _tickRate > 1000)
        return invalid("tick rate " + std::to_string(_tickRate) + " outside [1, 1000]");
    if (!(_worldBounds.max.x > _worldBounds.min.x) || !(_worldBounds.max.y > _worldBounds.min.y))
        return invalid("world bounds are empty");
    if (!(_cellSize > 0.0f) || !std::isfinite(_cellSize))
        return invalid("cell size must be positive");
    if (!std::isfinite(_gravity))
        return invalid("gravity must be finite");
    if (_tickBudgetMs < 0.0f)
        return invalid("negative tick budget");
    if (_interpolationDelayMs < 0.0f)
        return invalid("negative interpolation delay");
    if (_reconciliationEpsilon < 0.0f)
        return invalid("negative reconciliation epsilon");
    if (_inputBufferWindowMs < 0.0f)
        return invalid("negative input buffer window");
    if (_fullSnapshotInterval == 0)
        return invalid("full snapshot interval must be at least one tick");
    if (!(_clientTimeoutMs > 0.0f))
        return invalid("client timeout must be positive");
    if (_malformedThreshold == 0)
        return invalid("malformed packet threshold must be at least 1");
    if (_predictionHistory == 0 || _predictionHistory > core::kPredictionHistorySize)
        return invalid("prediction history must be in [1, " + std::to_string(core::kPredictionHistorySize) + "]");
    if (_snapshotHistory < 2)
        return invalid("snapshot history must keep at least 2 snapshots");
    if (_maxSessions == 0)
        return invalid("max sessions must be at least 1");

    Config cfg;
    cfg._worldBounds           = _worldBounds;
    cfg._tickRate              = _tickRate;
    cfg._tickBudgetMs          = _tickBudgetMs;
    cfg._cellSize              = _cellSize;
    cfg._gravity               = _gravity;
    cfg._interpolationDelayMs  = _interpolationDelayMs;
    cfg._reconciliationEpsilon = _reconciliationEpsilon;
    cfg._inputBufferWindowMs   = _inputBufferWindowMs;
    cfg._fullSnapshotInterval  = _fullSnapshotInterval;
    cfg._clientTimeoutMs       = _clientTimeoutMs;
    cfg._malformedThreshold    = _malformedThreshold;
    cfg._predictionHistory     = _predictionHistory;
    cfg._snapshotHistory       = _snapshotHistory;
    cfg._maxSessions           = _maxSessions;
    cfg._character             = _character.value_or(
        gameplay::CharacterConfig::forTickRate(_tickRate, _inputBufferWindowMs));
    return cfg;
}

core::f32 Config::fixedDeltaTime() const noexcept
{
    return 1.0f / static_cast<core::f32>(_tickRate);
}

core::f64 Config::tickBudgetSeconds() const noexcept
{
    return _tickBudgetMs > 0.0f ? static_cast<core::f64>(_tickBudgetMs) / 1000.0
                                : 1.0 / static_cast<core::f64>(_tickRate);
}

core::f64 Config::interpolationDelaySeconds() const noexcept
{
    return static_cast<core::f64>(_interpolationDelayMs) / 1000.0;
}

core::u32 Config::clientTimeoutTicks() const noexcept
{
    return gameplay::msToTicks(_clientTimeoutMs, _tickRate);
}

Config Config::defaults()
{
    Config cfg;
    cfg._worldBounds = {{core::kWorldMinX, core::kWorldMinY}, {core::kWorldMaxX, core::kWorldMaxY}};
    cfg._character   = gameplay::CharacterConfig::forTickRate(core::kTickRate, core::kInputBufferWindowMs);
    return cfg;
}

} // namespace rift::engine
