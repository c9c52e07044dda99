/**
 * @file World.cpp
 * @brief World implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/engine/World.hpp>
#include <rift/gameplay/CharacterSystem.hpp>
#include <rift/gameplay/CombatSystem.hpp>
#include <rift/physics/CollisionSystem.hpp>
#include <rift/physics/MovementSystem.hpp>
#include <rift/core/Log.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace rift::engine {

struct World::Impl
{
    Config                          config;
    ecs::Registry                   registry;
    ecs::SystemScheduler            scheduler;
    physics::CollisionEngine        collisions;
    gameplay::CharacterStateMachine characters;
    core::Tick                      tick{0};
    OverrunHandler                  onOverrun;

    explicit Impl(Config cfg)
        : config{std::move(cfg)}
        , collisions{config.cellSize()}
        , characters{config.character()}
    {}
};

World::World(Config config)
    : _impl{std::make_unique<Impl>(std::move(config))}
{
    const auto& cfg = _impl->config;

    std::vector<std::unique_ptr<ecs::ISystem>> systems;
    systems.push_back(std::make_unique<gameplay::CharacterSystem>(cfg.character()));
    systems.push_back(std::make_unique<physics::MovementSystem>(
        physics::MovementSettings{.gravity = cfg.gravity(), .worldBounds = cfg.worldBounds()}));
    systems.push_back(std::make_unique<physics::CollisionSystem>(_impl->collisions));
    systems.push_back(std::make_unique<gameplay::CombatSystem>(_impl->collisions, cfg.character()));

    for (auto& system : systems)
    {
        if (auto registered = _impl->scheduler.registerSystem(std::move(system)); !registered)
        {
            core::Log::error("ENGINE", "system registration failed: " + registered.error().message());
        }
    }
}

World::~World() = default;

core::Expected<void> World::step()
{
    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    const core::Log::TickScope stamp{_impl->tick + 1};

    _impl->scheduler.tick(_impl->registry, _impl->config.fixedDeltaTime());
    ++_impl->tick;

    const core::f64 elapsed = std::chrono::duration<core::f64>(Clock::now() - start).count();
    const core::f64 budget  = _impl->config.tickBudgetSeconds();
    if (elapsed <= budget)
    {
        return {};
    }

    core::Log::warn("ENGINE", "tick " + std::to_string(_impl->tick) + " overran: " +
                                  std::to_string(elapsed * 1000.0) + " ms for a " +
                                  std::to_string(budget * 1000.0) + " ms budget");
    if (_impl->onOverrun)
    {
        _impl->onOverrun(_impl->tick, elapsed);
    }
    return core::makeError(core::ErrorCode::kTickOverrun,
                           "tick " + std::to_string(_impl->tick) + " exceeded its budget");
}

core::Tick World::tick() const noexcept { return _impl->tick; }

void World::setTick(core::Tick tick) noexcept { _impl->tick = tick; }

void World::onOverrun(OverrunHandler handler) { _impl->onOverrun = std::move(handler); }

core::Expected<ecs::EntityId> World::spawnCharacter(math::Vec2f position, core::ClientId owner)
{
    auto& registry = _impl->registry;
    const auto id  = RIFT_TRY(registry.createEntity());

    RIFT_TRY_VOID(registry.addComponent(id, ecs::Transform{.position = position}));
    RIFT_TRY_VOID(registry.addComponent(id, ecs::Hitbox{.size = kCharacterSize}));
    RIFT_TRY_VOID(registry.addComponent(id, ecs::Body{}));
    RIFT_TRY_VOID(registry.addComponent(id, _impl->characters.spawn()));
    RIFT_TRY_VOID(registry.addComponent(id, ecs::PlayerInput{}));
    RIFT_TRY_VOID(registry.addComponent(id, ecs::Owner{owner}));
    RIFT_TRY_VOID(registry.addComponent(id, ecs::Replicated{}));
    return id;
}

core::Expected<ecs::EntityId> World::spawnPlatform(const math::AABBf& box)
{
    auto& registry = _impl->registry;
    const auto id  = RIFT_TRY(registry.createEntity());

    RIFT_TRY_VOID(registry.addComponent(id, ecs::Transform{.position = box.center()}));
    RIFT_TRY_VOID(registry.addComponent(id, ecs::Hitbox{.size = box.max - box.min}));
    RIFT_TRY_VOID(registry.addComponent(id, ecs::Body{.isStatic = true, .gravityScale = 0.0f}));
    RIFT_TRY_VOID(registry.addComponent(id, ecs::Replicated{}));
    return id;
}

core::u32 World::destroyOwnedBy(core::ClientId owner)
{
    auto& registry = _impl->registry;
    std::vector<ecs::EntityId> owned;
    for (const auto id : registry.query(ecs::Archetype::of<ecs::Owner>()))
    {
        if (registry.getComponent<ecs::Owner>(id)->clientId == owner)
        {
            owned.push_back(id);
        }
    }
    for (const auto id : owned)
    {
        registry.destroyEntity(id);
    }
    return static_cast<core::u32>(owned.size());
}

ecs::Registry&       World::registry() noexcept       { return _impl->registry; }
const ecs::Registry& World::registry() const noexcept { return _impl->registry; }

ecs::SystemScheduler& World::scheduler() noexcept { return _impl->scheduler; }

physics::CollisionEngine&       World::collisions() noexcept       { return _impl->collisions; }
const physics::CollisionEngine& World::collisions() const noexcept { return _impl->collisions; }

const gameplay::CharacterStateMachine& World::characters() const noexcept { return _impl->characters; }

const Config& World::config() const noexcept { return _impl->config; }

} // namespace rift::engine
