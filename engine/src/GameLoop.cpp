/**
 * @file GameLoop.cpp
 * @brief GameLoop implementation: fixed time-step with accumulator.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/engine/GameLoop.hpp>
#include <rift/core/Assert.hpp>
#include <rift/core/Log.hpp>

#include <chrono>
#include <string>
#include <thread>

namespace rift::engine {

GameLoop::GameLoop(const Config& config)
    : _fixedDt{1.0 / static_cast<core::f64>(config.tickRate())}
{
    RIFT_ASSERT(config.tickRate() > 0);
}

GameLoop::~GameLoop() = default;

core::u32 GameLoop::frame(core::f64 frameTime, const LoopCallbacks& callbacks)
{
    RIFT_ASSERT(callbacks.fixedUpdate);

    if (frameTime > kMaxFrameTime)
    {
        frameTime = kMaxFrameTime;
    }

    if (callbacks.preFrame)
    {
        callbacks.preFrame();
    }

    _accumulator += frameTime;
    core::u32 ticks   = 0;
    bool      overran = false;

    while (_accumulator >= _fixedDt)
    {
        auto result = callbacks.fixedUpdate(_fixedDt);
        _accumulator -= _fixedDt;
        ++_tickCount;
        ++ticks;

        if (result)
        {
            continue;
        }
        if (result.error().code() == core::ErrorCode::kTickOverrun)
        {
            overran = true;
            ++_overruns;
            if (callbacks.onOverrun)
            {
                callbacks.onOverrun(result.error());
            }
        }
        else
        {
            core::Log::error("ENGINE", "fixed update failed: " + result.error().message());
        }
    }

    if (overran)
    {
        ++_skippedRenders;
    }
    else if (callbacks.render)
    {
        callbacks.render(_accumulator / _fixedDt);
    }

    if (callbacks.postFrame)
    {
        callbacks.postFrame();
    }
    return ticks;
}

void GameLoop::run(const LoopCallbacks& callbacks)
{
    using Clock = std::chrono::steady_clock;

    _running = true;
    auto previous = Clock::now();

    while (_running)
    {
        const auto current = Clock::now();
        const core::f64 frameTime = std::chrono::duration<core::f64>(current - previous).count();
        previous = current;

        frame(frameTime, callbacks);

        const core::f64 idle = _fixedDt - _accumulator;
        if (idle > 0.001)
        {
            std::this_thread::sleep_for(std::chrono::duration<core::f64>(idle * 0.5));
        }
    }

    core::Log::info("ENGINE", "game loop stopped after " + std::to_string(_tickCount) + " ticks");
}

void GameLoop::requestStop() noexcept
{
    _running = false;
}

bool GameLoop::isRunning() const noexcept
{
    return _running;
}

core::u64 GameLoop::tickCount() const noexcept      { return _tickCount; }
core::u64 GameLoop::overrunCount() const noexcept   { return _overruns; }
core::u64 GameLoop::skippedRenders() const noexcept { return _skippedRenders; }

} // namespace rift::engine
