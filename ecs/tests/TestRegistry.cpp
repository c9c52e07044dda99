/**
 * @file TestRegistry.cpp
 * @brief Unit tests for ecs::Registry.
 */

#include <catch2/catch_test_macros.hpp>

#include "rift/ecs/Registry.hpp"

#include <algorithm>
#include <vector>

namespace rift::ecs {

TEST_CASE("Registry creates live entities with empty archetype", "[ecs][registry]")
{
    Registry registry;

    auto created = registry.createEntity();
    REQUIRE(created.has_value());

    const EntityId id = *created;
    REQUIRE(registry.isAlive(id));
    REQUIRE(registry.liveCount() == 1);
    REQUIRE(registry.archetypeOf(id).empty());
}

TEST_CASE("Archetype tracks attached components after any add/remove sequence", "[ecs][registry][archetype]")
{
    Registry registry;
    const EntityId id = registry.createEntity().value();

    REQUIRE(registry.addComponent(id, Transform{}).has_value());
    REQUIRE(registry.addComponent(id, Hitbox{}).has_value());
    REQUIRE(registry.addComponent(id, Body{}).has_value());
    REQUIRE(registry.removeComponent<Hitbox>(id).has_value());
    REQUIRE(registry.addComponent(id, Replicated{}).has_value());
    REQUIRE(registry.removeComponent<Body>(id).has_value());
    REQUIRE(registry.addComponent(id, Hitbox{}).has_value());
    REQUIRE(registry.removeComponent<Owner>(id).has_value());

    const Archetype expected{ComponentId::Transform, ComponentId::Hitbox, ComponentId::Replicated};
    REQUIRE(registry.archetypeOf(id) == expected);

    for (core::usize bit = 0; bit < Archetype::kMaxComponents; ++bit)
    {
        const auto component = static_cast<ComponentId>(bit);
        REQUIRE(registry.hasComponent(id, component) == expected.has(component));
    }
}

TEST_CASE("Adding an existing component replaces its value", "[ecs][registry]")
{
    Registry registry;
    const EntityId id = registry.createEntity().value();

    REQUIRE(registry.addComponent(id, Body{.mass = 2.0f}).has_value());
    REQUIRE(registry.addComponent(id, Body{.mass = 7.0f}).has_value());

    const Body* body = registry.getComponent<Body>(id);
    REQUIRE(body != nullptr);
    REQUIRE(body->mass == 7.0f);
    REQUIRE(registry.archetypeOf(id).count() == 1);
}

TEST_CASE("Stale ids are rejected even after slot reuse", "[ecs][registry][generation]")
{
    Registry registry;
    const EntityId old = registry.createEntity().value();
    REQUIRE(registry.addComponent(old, Transform{}).has_value());

    registry.destroyEntity(old);
    REQUIRE_FALSE(registry.isAlive(old));

    const EntityId reused = registry.createEntity().value();
    REQUIRE(reused.slot() == old.slot());
    REQUIRE(reused.generation() != old.generation());

    SECTION("addComponent")
    {
        auto result = registry.addComponent(old, Transform{});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidEntity);
        REQUIRE_FALSE(registry.hasComponent<Transform>(reused));
    }

    SECTION("removeComponent")
    {
        REQUIRE(registry.addComponent(reused, Transform{}).has_value());
        auto result = registry.removeComponent<Transform>(old);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidEntity);
        REQUIRE(registry.hasComponent<Transform>(reused));
    }

    SECTION("getComponent")
    {
        REQUIRE(registry.addComponent(reused, Transform{}).has_value());
        REQUIRE(registry.getComponent<Transform>(old) == nullptr);
        REQUIRE(registry.getComponent<Transform>(reused) != nullptr);
    }

    SECTION("destroyEntity is idempotent")
    {
        registry.destroyEntity(old);
        REQUIRE(registry.isAlive(reused));
        REQUIRE(registry.liveCount() == 1);
    }
}

TEST_CASE("Entity ids print as slot and generation", "[ecs][entity]")
{
    REQUIRE(toString(EntityId{}) == "null");
    REQUIRE(toString(EntityId{3, 12}) == "12#3");

    Registry registry;
    const EntityId first = registry.createEntity().value();
    registry.destroyEntity(first);
    const EntityId second = registry.createEntity().value();
    REQUIRE(toString(second) == "0#1");

    auto stale = registry.addComponent(first, Transform{});
    REQUIRE_FALSE(stale.has_value());
    REQUIRE(stale.error().message().ends_with("stale entity 0#0"));
}

TEST_CASE("Null id is never alive", "[ecs][registry]")
{
    Registry registry;
    (void)registry.createEntity();

    const EntityId null{};
    REQUIRE_FALSE(null.isValid());
    REQUIRE_FALSE(registry.isAlive(null));
    REQUIRE(registry.addComponent(null, Transform{}).error().code() == core::ErrorCode::kInvalidEntity);
}

TEST_CASE("Query returns entities of every matching archetype group", "[ecs][registry][query]")
{
    Registry registry;

    const EntityId a = registry.createEntity().value();
    const EntityId b = registry.createEntity().value();
    const EntityId c = registry.createEntity().value();

    REQUIRE(registry.addComponent(a, Transform{}).has_value());
    REQUIRE(registry.addComponent(b, Transform{}).has_value());
    REQUIRE(registry.addComponent(b, Hitbox{}).has_value());
    REQUIRE(registry.addComponent(c, Hitbox{}).has_value());

    auto ids = registry.query(Archetype::of<Transform>()).collect();
    std::ranges::sort(ids);
    REQUIRE(ids == std::vector<EntityId>{a, b});

    SECTION("exclusion filters whole groups")
    {
        auto onlyA = registry.query(Archetype::of<Transform>(), Archetype::of<Hitbox>()).collect();
        REQUIRE(onlyA == std::vector<EntityId>{a});
    }

    SECTION("cache is invalidated when a new matching group appears")
    {
        REQUIRE(registry.query(Archetype::of<Hitbox>()).count() == 2);

        REQUIRE(registry.addComponent(c, Body{}).has_value());
        REQUIRE(registry.addComponent(a, Hitbox{}).has_value());

        REQUIRE(registry.query(Archetype::of<Hitbox>()).count() == 3);
    }

    SECTION("destroyed entities leave the query")
    {
        registry.destroyEntity(b);
        REQUIRE(registry.query(Archetype::of<Transform>()).collect() == std::vector<EntityId>{a});
    }
}

TEST_CASE("Structural mutations are deferred while iterating", "[ecs][registry][deferred]")
{
    Registry registry;

    std::vector<EntityId> ids;
    for (int i = 0; i < 4; ++i)
    {
        const EntityId id = registry.createEntity().value();
        REQUIRE(registry.addComponent(id, Transform{}).has_value());
        ids.push_back(id);
    }

    EntityId spawned{};
    core::usize visited = 0;
    {
        Registry::IterationScope scope{registry};
        REQUIRE(registry.isDeferring());

        for (EntityId id : registry.query(Archetype::of<Transform>()))
        {
            ++visited;
            registry.destroyEntity(id);

            auto added = registry.addComponent(id, Body{});
            REQUIRE_FALSE(added.has_value());
            REQUIRE(added.error().code() == core::ErrorCode::kInvalidEntity);

            auto removed = registry.removeComponent<Transform>(id);
            REQUIRE_FALSE(removed.has_value());
            REQUIRE(removed.error().code() == core::ErrorCode::kInvalidEntity);

            if (!spawned.isValid())
            {
                spawned = registry.createEntity().value();
                REQUIRE(registry.addComponent(spawned, Transform{}).has_value());
            }
        }

        // The destroyed ids die at once, the new entity waits for the flush.
        REQUIRE(visited == ids.size());
        REQUIRE_FALSE(registry.isAlive(ids.front()));
        REQUIRE(registry.getComponent<Transform>(ids.front()) == nullptr);
        REQUIRE(registry.isAlive(spawned));
        REQUIRE(registry.getComponent<Transform>(spawned) == nullptr);
        REQUIRE(registry.query(Archetype::of<Transform>()).empty());
        REQUIRE(registry.query(Archetype::of<Transform>()).count() == 0);
        REQUIRE(registry.liveCount() == 1);
    }

    REQUIRE_FALSE(registry.isDeferring());
    for (EntityId id : ids)
    {
        REQUIRE_FALSE(registry.isAlive(id));
    }
    REQUIRE(registry.isAlive(spawned));
    REQUIRE(registry.hasComponent<Transform>(spawned));
    REQUIRE(registry.query(Archetype::of<Transform>()).count() == 1);
    REQUIRE(registry.liveCount() == 1);
}

TEST_CASE("Destroyed slots are not recycled before the flush", "[ecs][registry][deferred]")
{
    Registry registry;
    const EntityId doomed = registry.createEntity().value();

    EntityId reused{};
    {
        Registry::IterationScope scope{registry};
        registry.destroyEntity(doomed);
        reused = registry.createEntity().value();
        REQUIRE(reused.slot() != doomed.slot());
    }

    const EntityId recycled = registry.createEntity().value();
    REQUIRE(recycled.slot() == doomed.slot());
    REQUIRE(recycled != doomed);
    REQUIRE_FALSE(registry.isAlive(doomed));
}

TEST_CASE("Creating entities while iterating keeps borrowed components valid", "[ecs][registry][deferred]")
{
    Registry registry;
    for (int i = 0; i < 2; ++i)
    {
        const EntityId id = registry.createEntity().value();
        REQUIRE(registry.addComponent(id, Transform{}).has_value());
    }

    std::vector<EntityId> spawned;
    registry.each<Transform>([&](EntityId, Transform& transform) {
        for (int i = 0; i < 64; ++i)
        {
            const EntityId id = registry.createEntity().value();
            REQUIRE(registry.addComponent(id, Transform{.position = {1.0f, 2.0f}}).has_value());
            spawned.push_back(id);
        }
        transform.position.x = 42.0f;
    });

    core::usize moved = 0;
    for (EntityId id : registry.query(Archetype::of<Transform>()))
    {
        const Transform* transform = registry.getComponent<Transform>(id);
        REQUIRE(transform != nullptr);
        moved += transform->position.x == 42.0f ? 1u : 0u;
    }
    REQUIRE(moved == 2);
    REQUIRE(spawned.size() == 128);
    REQUIRE(registry.getComponent<Transform>(spawned.back())->position.y == 2.0f);
}

TEST_CASE("each visits typed components and defers mutations", "[ecs][registry][each]")
{
    Registry registry;
    for (int i = 0; i < 3; ++i)
    {
        const EntityId id = registry.createEntity().value();
        REQUIRE(registry.addComponent(id, Transform{.position = {static_cast<float>(i), 0.0f}}).has_value());
        REQUIRE(registry.addComponent(id, Body{}).has_value());
    }

    float sum = 0.0f;
    registry.each<Transform, Body>([&](EntityId id, Transform& transform, Body&) {
        sum += transform.position.x;
        transform.position.y = 5.0f;
        registry.destroyEntity(id);
        REQUIRE_FALSE(registry.isAlive(id));
    });

    REQUIRE(sum == 3.0f);
    REQUIRE(registry.liveCount() == 0);
}

TEST_CASE("clear destroys every entity", "[ecs][registry]")
{
    Registry registry;
    std::vector<EntityId> ids;
    for (int i = 0; i < 5; ++i)
    {
        ids.push_back(registry.createEntity().value());
    }

    registry.clear();

    REQUIRE(registry.liveCount() == 0);
    for (EntityId id : ids)
    {
        REQUIRE_FALSE(registry.isAlive(id));
    }
}

} // namespace rift::ecs
