/**
 * @file CollisionEngine.cpp
 * @brief Collision pass: broad phase, narrow phase, resolution, events.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/physics/CollisionEngine.hpp>
#include <rift/physics/CollisionDetector.hpp>
#include <rift/ecs/Registry.hpp>

#include <algorithm>
#include <utility>

namespace rift::physics {

namespace {

using Pair = std::pair<ecs::EntityId, ecs::EntityId>;

[[nodiscard]] core::f32 inverseMass(const ecs::Body* body) noexcept
{
    if (body == nullptr)
    {
        return 1.0f;
    }
    if (body->isStatic || body->mass <= 0.0f)
    {
        return 0.0f;
    }
    return 1.0f / body->mass;
}

/// Removes the part of @p velocity moving against @p normal.
void clipVelocity(math::Vec2f& velocity, math::Vec2f normal) noexcept
{
    const core::f32 into = velocity.dot(normal);
    if (into < 0.0f)
    {
        velocity -= normal * into;
    }
}

} // namespace

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct CollisionEngine::Impl
{
    SpatialGrid                   grid;
    CollisionLayers               layers;
    std::vector<CollisionHandler> handlers;
    std::vector<CollisionEvent>   events;
    std::vector<Pair>             triggerPairs;
    std::vector<Pair>             previousTriggerPairs;
    bool                          muted{false};

    explicit Impl(core::f32 cellSize) : grid{cellSize} {}

    void resolveSolid(ecs::Registry& registry, ecs::EntityId a, ecs::EntityId b,
                      const ContactPoint& contact)
    {
        auto* bodyA = registry.getComponent<ecs::Body>(a);
        auto* bodyB = registry.getComponent<ecs::Body>(b);

        // Interpolated entities follow snapshots and never yield.
        const core::f32 invA  = registry.hasComponent<ecs::Interpolated>(a) ? 0.0f : inverseMass(bodyA);
        const core::f32 invB  = registry.hasComponent<ecs::Interpolated>(b) ? 0.0f : inverseMass(bodyB);
        const core::f32 total = invA + invB;
        if (total <= 0.0f)
        {
            return;
        }

        auto& ta = *registry.getComponent<ecs::Transform>(a);
        auto& tb = *registry.getComponent<ecs::Transform>(b);

        const math::Vec2f normal = contact.normal;
        const core::f32   depth  = contact.penetrationDepth;

        if (invA > 0.0f)
        {
            ta.position += normal * (depth * invA / total);
            clipVelocity(ta.velocity, normal);
            if (bodyA != nullptr && normal.y > 0.0f)
            {
                bodyA->grounded = true;
            }
        }
        if (invB > 0.0f)
        {
            tb.position -= normal * (depth * invB / total);
            clipVelocity(tb.velocity, -normal);
            if (bodyB != nullptr && normal.y < 0.0f)
            {
                bodyB->grounded = true;
            }
        }
    }

    /// Diffs this tick's trigger overlaps against the previous tick's.
    void buildTriggerEvents()
    {
        std::ranges::sort(triggerPairs);

        auto current  = triggerPairs.begin();
        auto previous = previousTriggerPairs.begin();

        while (current != triggerPairs.end() || previous != previousTriggerPairs.end())
        {
            if (previous == previousTriggerPairs.end()
                || (current != triggerPairs.end() && *current < *previous))
            {
                events.push_back({current->first, current->second, CollisionEventKind::Enter});
                ++current;
            }
            else if (current == triggerPairs.end() || *previous < *current)
            {
                events.push_back({previous->first, previous->second, CollisionEventKind::Exit});
                ++previous;
            }
            else
            {
                events.push_back({current->first, current->second, CollisionEventKind::Stay});
                ++current;
                ++previous;
            }
        }

        previousTriggerPairs = std::move(triggerPairs);
        triggerPairs.clear();
    }

    void dispatch() const
    {
        if (muted)
        {
            return;
        }
        for (const auto& event : events)
        {
            for (const auto& handler : handlers)
            {
                handler(event);
            }
        }
    }
};

// ========================================================================== //
//  Public API                                                                //
// ========================================================================== //

CollisionEngine::CollisionEngine(core::f32 cellSize)
    : _impl{std::make_unique<Impl>(cellSize)}
{}

CollisionEngine::~CollisionEngine() = default;

void CollisionEngine::step(ecs::Registry& registry)
{
    step(registry, registry.query(ecs::Archetype::of<ecs::Transform, ecs::Hitbox>()));
}

void CollisionEngine::step(ecs::Registry& registry, const ecs::Query& entities)
{
    auto& impl = *_impl;
    impl.events.clear();
    impl.grid.clear();

    // ---- Broad phase ------------------------------------------------------
    std::vector<ecs::EntityId> ids;
    for (ecs::EntityId id : entities)
    {
        const auto* transform = registry.getComponent<ecs::Transform>(id);
        const auto* hitbox    = registry.getComponent<ecs::Hitbox>(id);
        if (transform == nullptr || hitbox == nullptr)
        {
            continue;
        }
        ids.push_back(id);
        impl.grid.insert(id, worldBox(*transform, *hitbox));
    }
    std::ranges::sort(ids);

    std::vector<Pair> pairs;
    for (ecs::EntityId id : ids)
    {
        const auto& hitbox = *registry.getComponent<ecs::Hitbox>(id);
        const auto  box    = worldBox(*registry.getComponent<ecs::Transform>(id), hitbox);

        for (ecs::EntityId other : impl.grid.queryRegion(box))
        {
            // Each pair is emitted from its lower member only.
            if (other <= id)
            {
                continue;
            }
            if (!impl.layers.collides(hitbox.layer, registry.getComponent<ecs::Hitbox>(other)->layer))
            {
                continue;
            }
            pairs.emplace_back(id, other);
        }
    }
    std::ranges::sort(pairs);

    // ---- Narrow phase + resolution ----------------------------------------
    for (const auto& [a, b] : pairs)
    {
        const auto& hitboxA = *registry.getComponent<ecs::Hitbox>(a);
        const auto& hitboxB = *registry.getComponent<ecs::Hitbox>(b);

        const CollisionResult result = CollisionDetector::testAABBvsAABB(
            worldBox(*registry.getComponent<ecs::Transform>(a), hitboxA),
            worldBox(*registry.getComponent<ecs::Transform>(b), hitboxB));

        if (!result.colliding)
        {
            continue;
        }

        if (hitboxA.mode == ecs::HitboxMode::Solid && hitboxB.mode == ecs::HitboxMode::Solid)
        {
            impl.resolveSolid(registry, a, b, result.contact);
        }
        else
        {
            impl.triggerPairs.emplace_back(a, b);
        }
    }

    impl.buildTriggerEvents();
    impl.dispatch();
}

void CollisionEngine::onEvent(CollisionHandler handler)
{
    _impl->handlers.push_back(std::move(handler));
}

void CollisionEngine::setEventsMuted(bool muted) noexcept
{
    _impl->muted = muted;
}

bool CollisionEngine::eventsMuted() const noexcept
{
    return _impl->muted;
}

const std::vector<CollisionEvent>& CollisionEngine::lastEvents() const noexcept
{
    return _impl->events;
}

std::vector<ecs::EntityId> CollisionEngine::queryRegion(const math::AABBf& region) const
{
    return _impl->grid.queryRegion(region);
}

void CollisionEngine::resetContacts()
{
    _impl->previousTriggerPairs.clear();
    _impl->triggerPairs.clear();
}

CollisionLayers& CollisionEngine::layers() noexcept
{
    return _impl->layers;
}

const CollisionLayers& CollisionEngine::layers() const noexcept
{
    return _impl->layers;
}

const SpatialGrid& CollisionEngine::grid() const noexcept
{
    return _impl->grid;
}

math::AABBf CollisionEngine::worldBox(const ecs::Transform& transform,
                                      const ecs::Hitbox& hitbox) noexcept
{
    return math::AABBf::fromCenter(transform.position + hitbox.offset, hitbox.size);
}

} // namespace rift::physics
