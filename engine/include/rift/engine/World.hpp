/**
 * @file World.hpp
 * @brief One simulation instance: entity store, systems, collisions and
 *        the tick counter, bundled as an explicit context.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_ENGINE_WORLD_HPP
    #define RIFT_ENGINE_WORLD_HPP

#include <rift/engine/Config.hpp>
#include <rift/gameplay/CharacterStateMachine.hpp>
#include <rift/physics/CollisionEngine.hpp>
#include <rift/ecs/Registry.hpp>
#include <rift/ecs/SystemScheduler.hpp>
#include <rift/core/Expected.hpp>
#include <rift/core/NonCopyable.hpp>
#include <rift/core/Types.hpp>

#include <functional>
#include <memory>

namespace rift::engine {

/** @brief Hitbox of a spawned character. */
inline constexpr math::Vec2f kCharacterSize{32.0f, 48.0f};

/**
 * @class World
 * @brief Registry + SystemScheduler + CollisionEngine + Config + tick.
 *
 * Registers the Character (100), Movement (200), Collision (300) and
 * Combat (400) systems at construction.  Worlds share nothing, so a server
 * and several predicting clients can live in one process.
 */
class World final : public core::NonCopyable<World>
{
public:
    /** @brief Called after a tick that took longer than its budget. */
    using OverrunHandler = std::function<void(core::Tick tick, core::f64 elapsedSeconds)>;

    explicit World(Config config);
    ~World();

    /**
     * @brief Runs one fixed tick of every enabled system.
     *
     * The tick always completes.
     * @return kTickOverrun when it exceeded Config::tickBudgetSeconds().
     */
    [[nodiscard]] core::Expected<void> step();

    /** @brief Ticks completed so far. */
    [[nodiscard]] core::Tick tick() const noexcept;

    /** @brief Forces the tick counter (client adopting the server clock). */
    void setTick(core::Tick tick) noexcept;

    void onOverrun(OverrunHandler handler);

    // --------------------------------------------------------------------- //
    //  Spawning                                                              //
    // --------------------------------------------------------------------- //

    /**
     * @brief Spawns a replicated, controllable character standing at
     *        @p position (centre of its hitbox).
     */
    [[nodiscard]] core::Expected<ecs::EntityId> spawnCharacter(math::Vec2f position,
                                                               core::ClientId owner = core::kNoClient);

    /** @brief Spawns a replicated static solid box. */
    [[nodiscard]] core::Expected<ecs::EntityId> spawnPlatform(const math::AABBf& box);

    /** @brief Destroys every entity owned by @p owner. */
    core::u32 destroyOwnedBy(core::ClientId owner);

    // --------------------------------------------------------------------- //
    //  Access                                                                //
    // --------------------------------------------------------------------- //

    [[nodiscard]] ecs::Registry&       registry() noexcept;
    [[nodiscard]] const ecs::Registry& registry() const noexcept;

    [[nodiscard]] ecs::SystemScheduler& scheduler() noexcept;

    [[nodiscard]] physics::CollisionEngine&       collisions() noexcept;
    [[nodiscard]] const physics::CollisionEngine& collisions() const noexcept;

    [[nodiscard]] const gameplay::CharacterStateMachine& characters() const noexcept;

    [[nodiscard]] const Config& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rift::engine

#endif // RIFT_ENGINE_WORLD_HPP
