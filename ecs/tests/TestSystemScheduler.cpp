/**
 * @file TestSystemScheduler.cpp
 * @brief Unit tests for ecs::SystemScheduler.
 */

#include <catch2/catch_test_macros.hpp>

#include "rift/ecs/Registry.hpp"
#include "rift/ecs/SystemScheduler.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rift::ecs {

namespace {

class RecordingSystem final : public ISystem
{
public:
    RecordingSystem(std::string_view name, core::i32 priority, std::vector<std::string>& log,
                    Archetype required = {}, Archetype excluded = {})
        : _descriptor{name, priority, required, excluded}, _log{log}
    {}

    const SystemDescriptor& descriptor() const noexcept override { return _descriptor; }

    void update(Registry&, const Query& entities, core::f32) override
    {
        _log.emplace_back(_descriptor.name);
        lastCount = entities.count();
    }

    core::usize lastCount{0};

private:
    SystemDescriptor          _descriptor;
    std::vector<std::string>& _log;
};

/// Spawns one entity per update; the spawn must only show up next tick.
class SpawnerSystem final : public ISystem
{
public:
    const SystemDescriptor& descriptor() const noexcept override { return _descriptor; }

    void update(Registry& registry, const Query& entities, core::f32) override
    {
        seen = entities.count();
        const EntityId id = registry.createEntity().value();
        (void)registry.addComponent(id, Transform{});
    }

    core::usize seen{0};

private:
    SystemDescriptor _descriptor{"Spawner", 0, Archetype::of<Transform>(), {}};
};

} // namespace

TEST_CASE("Systems run in ascending priority, ties by registration order", "[ecs][scheduler]")
{
    Registry                 registry;
    SystemScheduler          scheduler;
    std::vector<std::string> log;

    REQUIRE(scheduler.registerSystem(std::make_unique<RecordingSystem>("C", 300, log)).has_value());
    REQUIRE(scheduler.registerSystem(std::make_unique<RecordingSystem>("A", 100, log)).has_value());
    REQUIRE(scheduler.registerSystem(std::make_unique<RecordingSystem>("B1", 200, log)).has_value());
    REQUIRE(scheduler.registerSystem(std::make_unique<RecordingSystem>("B2", 200, log)).has_value());
    REQUIRE(scheduler.registerSystem(std::make_unique<RecordingSystem>("Z", -5, log)).has_value());

    scheduler.tick(registry, 1.0f / 60.0f);

    REQUIRE(log == std::vector<std::string>{"Z", "A", "B1", "B2", "C"});
    REQUIRE(scheduler.systemCount() == 5);
}

TEST_CASE("Scheduler rejects invalid registrations", "[ecs][scheduler]")
{
    SystemScheduler          scheduler;
    std::vector<std::string> log;

    SECTION("null")
    {
        auto result = scheduler.registerSystem(nullptr);
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("duplicate name")
    {
        REQUIRE(scheduler.registerSystem(std::make_unique<RecordingSystem>("Same", 1, log)).has_value());
        auto result = scheduler.registerSystem(std::make_unique<RecordingSystem>("Same", 2, log));
        REQUIRE(result.error().code() == core::ErrorCode::kAlreadyExists);
        REQUIRE(scheduler.systemCount() == 1);
    }
}

TEST_CASE("Disabled systems are skipped", "[ecs][scheduler]")
{
    Registry                 registry;
    SystemScheduler          scheduler;
    std::vector<std::string> log;

    REQUIRE(scheduler.registerSystem(std::make_unique<RecordingSystem>("A", 1, log)).has_value());
    REQUIRE(scheduler.registerSystem(std::make_unique<RecordingSystem>("B", 2, log)).has_value());
    REQUIRE(scheduler.setEnabled("A", false).has_value());
    REQUIRE_FALSE(scheduler.isEnabled("A"));
    REQUIRE(scheduler.setEnabled("missing", false).error().code() == core::ErrorCode::kNotFound);

    scheduler.tick(registry, 0.016f);
    REQUIRE(log == std::vector<std::string>{"B"});
}

TEST_CASE("Systems receive entities matching their descriptor", "[ecs][scheduler]")
{
    Registry                 registry;
    SystemScheduler          scheduler;
    std::vector<std::string> log;

    const EntityId mover  = registry.createEntity().value();
    const EntityId remote = registry.createEntity().value();
    REQUIRE(registry.addComponent(mover, Transform{}).has_value());
    REQUIRE(registry.addComponent(remote, Transform{}).has_value());
    REQUIRE(registry.addComponent(remote, Interpolated{}).has_value());

    auto system = std::make_unique<RecordingSystem>("Move", 1, log, Archetype::of<Transform>(),
                                                    Archetype::of<Interpolated>());
    RecordingSystem* raw = system.get();
    REQUIRE(scheduler.registerSystem(std::move(system)).has_value());

    scheduler.tick(registry, 0.016f);
    REQUIRE(raw->lastCount == 1);
}

TEST_CASE("Entities spawned during a tick appear on the next tick", "[ecs][scheduler][deferred]")
{
    Registry        registry;
    SystemScheduler scheduler;

    auto spawner = std::make_unique<SpawnerSystem>();
    SpawnerSystem* raw = spawner.get();
    REQUIRE(scheduler.registerSystem(std::move(spawner)).has_value());

    scheduler.tick(registry, 0.016f);
    REQUIRE(raw->seen == 0);
    REQUIRE(registry.liveCount() == 1);

    scheduler.tick(registry, 0.016f);
    REQUIRE(raw->seen == 1);
    REQUIRE(registry.liveCount() == 2);
}

} // namespace rift::ecs
