/**
 * @file GameLoop.hpp
 * @brief Fixed time-step host loop.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_ENGINE_GAMELOOP_HPP
    #define RIFT_ENGINE_GAMELOOP_HPP

#include <rift/engine/Config.hpp>
#include <rift/core/Types.hpp>
#include <rift/core/Expected.hpp>

#include <atomic>
#include <functional>

namespace rift::engine {

/** @brief Callbacks the game loop invokes each frame. */
struct LoopCallbacks
{
    /**
     * @brief Called once per fixed tick (dt = 1/tickRate).  A
     *        kTickOverrun error is routed to @c onOverrun; any other error
     *        is logged.
     */
    std::function<core::Expected<void>(core::f64 dt)> fixedUpdate;

    /** @brief Called once per render frame with interpolation alpha [0,1]. */
    std::function<void(core::f64 alpha)> render;

    /** @brief Called once per frame before fixed updates (input poll, etc.). */
    std::function<void()> preFrame;

    /** @brief Called once per frame after render. */
    std::function<void()> postFrame;

    /** @brief Called for every overrun; the frame's render is then skipped. */
    std::function<void(const core::Error&)> onOverrun;
};

/** @brief Fixed time-step game loop with an accumulator. */
class GameLoop
{
public:
    /// Longest frame accounted for; anything slower is clamped.
    static constexpr core::f64 kMaxFrameTime = 0.25;

    /// @param config Provides the tick rate.
    explicit GameLoop(const Config& config);
    ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    /**
     * @brief Run the loop until requestStop() is called.
     * @param callbacks Tick / render callbacks.
     */
    void run(const LoopCallbacks& callbacks);

    /**
     * @brief Processes one frame that lasted @p frameTime seconds: runs as
     *        many fixed ticks as the accumulator allows, then renders
     *        unless a tick overran.
     * @return Number of fixed ticks run.
     */
    core::u32 frame(core::f64 frameTime, const LoopCallbacks& callbacks);

    /** @brief Request graceful loop termination (thread-safe). */
    void requestStop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    /** @brief Total ticks elapsed since construction. */
    [[nodiscard]] core::u64 tickCount() const noexcept;

    /** @brief Total overruns reported by fixedUpdate. */
    [[nodiscard]] core::u64 overrunCount() const noexcept;

    /** @brief Frames whose render was skipped. */
    [[nodiscard]] core::u64 skippedRenders() const noexcept;

private:
    core::f64         _fixedDt;
    core::f64         _accumulator{0.0};
    std::atomic<bool> _running{false};
    core::u64         _tickCount{0};
    core::u64         _overruns{0};
    core::u64         _skippedRenders{0};
};

} // namespace rift::engine

#endif // RIFT_ENGINE_GAMELOOP_HPP
