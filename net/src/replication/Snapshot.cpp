/**
 * @file Snapshot.cpp
 * @brief Snapshot capture, diff and patch.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/replication/Snapshot.hpp>

#include <algorithm>
#include <string>
#include <unordered_set>

namespace rift::net::replication {

using protocol::EntityState;

namespace {

[[nodiscard]] bool lessById(const EntityState& a, const EntityState& b) noexcept
{
    return a.entityId < b.entityId;
}

/** @brief Bits of @p field where @p current differs from @p base. */
[[nodiscard]] core::u8 changedFields(const EntityState& current, const EntityState& base) noexcept
{
    core::u8 changed = protocol::kFieldNone;
    const auto differs = [&](protocol::ReplicatedField field, bool equal) {
        if (current.has(field) && (!base.has(field) || !equal))
        {
            changed |= field;
        }
    };
    differs(protocol::kFieldTransform, current.transform == base.transform);
    differs(protocol::kFieldHitbox,    current.hitbox == base.hitbox);
    differs(protocol::kFieldBody,      current.body == base.body);
    differs(protocol::kFieldCharacter, current.character == base.character);
    differs(protocol::kFieldOwner,     current.owner == base.owner);
    return changed;
}

void patch(EntityState& target, const EntityState& entry) noexcept
{
    if (entry.has(protocol::kFieldTransform)) target.transform = entry.transform;
    if (entry.has(protocol::kFieldHitbox))    target.hitbox    = entry.hitbox;
    if (entry.has(protocol::kFieldBody))      target.body      = entry.body;
    if (entry.has(protocol::kFieldCharacter)) target.character = entry.character;
    if (entry.has(protocol::kFieldOwner))     target.owner     = entry.owner;
    target.mask |= static_cast<core::u8>(entry.mask & protocol::kComponentFieldMask);
}

} // namespace

const EntityState* Snapshot::find(core::u32 entityId) const noexcept
{
    const auto it = std::ranges::lower_bound(entities, entityId, {}, &EntityState::entityId);
    return (it != entities.end() && it->entityId == entityId) ? &*it : nullptr;
}

protocol::CharacterState toCharacterState(const ecs::Character& character) noexcept
{
    return protocol::CharacterState{
        .health            = character.health,
        .maxHealth         = character.maxHealth,
        .state             = character.state,
        .stateTicks        = character.stateTicks,
        .facing            = character.facing,
        .invulnerableTicks = character.invulnerableTicks,
        .attackConnected   = character.attackConnected,
    };
}

void applyCharacterState(ecs::Character& character, const protocol::CharacterState& state) noexcept
{
    character.health            = state.health;
    character.maxHealth         = state.maxHealth;
    character.state             = state.state;
    character.stateTicks        = state.stateTicks;
    character.facing            = state.facing;
    character.invulnerableTicks = state.invulnerableTicks;
    character.attackConnected   = state.attackConnected;
}

Snapshot captureSnapshot(const ecs::Registry& registry, core::Tick tick)
{
    Snapshot snapshot;
    snapshot.tick = tick;

    for (const auto id : registry.query(ecs::Archetype::of<ecs::Replicated>()))
    {
        EntityState state;
        state.entityId = id.raw();
        state.mask     = protocol::kFieldReplace;

        if (const auto* t = registry.getComponent<ecs::Transform>(id))
        {
            state.transform = *t;
            state.mask |= protocol::kFieldTransform;
        }
        if (const auto* h = registry.getComponent<ecs::Hitbox>(id))
        {
            state.hitbox = *h;
            state.mask |= protocol::kFieldHitbox;
        }
        if (const auto* b = registry.getComponent<ecs::Body>(id))
        {
            state.body = *b;
            state.mask |= protocol::kFieldBody;
        }
        if (const auto* c = registry.getComponent<ecs::Character>(id))
        {
            state.character = toCharacterState(*c);
            state.mask |= protocol::kFieldCharacter;
        }
        if (const auto* o = registry.getComponent<ecs::Owner>(id))
        {
            state.owner = *o;
            state.mask |= protocol::kFieldOwner;
        }
        snapshot.entities.push_back(state);
    }

    std::ranges::sort(snapshot.entities, lessById);
    return snapshot;
}

protocol::SnapshotDelta makeDelta(const Snapshot& current, const Snapshot* baseline,
                                  core::Sequence ackedInput)
{
    protocol::SnapshotDelta delta;
    delta.tick       = current.tick;
    delta.baseTick   = baseline ? baseline->tick : 0;
    delta.ackedInput = ackedInput;

    if (!baseline)
    {
        delta.entries = current.entities;
        return delta;
    }

    for (const auto& entity : current.entities)
    {
        const auto* base = baseline->find(entity.entityId);
        const auto lost = base ? (base->mask & ~entity.mask & protocol::kComponentFieldMask) : 0;
        if (!base || lost != 0)
        {
            delta.entries.push_back(entity);
            continue;
        }

        const auto changed = changedFields(entity, *base);
        if (changed == protocol::kFieldNone)
        {
            continue;
        }
        EntityState entry = entity;
        entry.mask = changed;
        delta.entries.push_back(entry);
    }

    for (const auto& entity : baseline->entities)
    {
        if (!current.find(entity.entityId))
        {
            delta.removed.push_back(entity.entityId);
        }
    }
    return delta;
}

core::Expected<Snapshot> applyDelta(const protocol::SnapshotDelta& delta, const Snapshot* baseline)
{
    Snapshot result;
    result.tick = delta.tick;

    if (!delta.isFull())
    {
        if (!baseline || baseline->tick != delta.baseTick)
        {
            return core::makeError(core::ErrorCode::kInvalidState,
                                   "Missing baseline tick " + std::to_string(delta.baseTick));
        }
        const std::unordered_set<core::u32> removed{delta.removed.begin(), delta.removed.end()};
        for (const auto& entity : baseline->entities)
        {
            if (!removed.contains(entity.entityId))
            {
                result.entities.push_back(entity);
            }
        }
    }

    for (const auto& entry : delta.entries)
    {
        const auto it = std::ranges::lower_bound(result.entities, entry.entityId, {}, &EntityState::entityId);
        const bool present = it != result.entities.end() && it->entityId == entry.entityId;

        if (entry.has(protocol::kFieldReplace))
        {
            if (present)
            {
                *it = entry;
            }
            else
            {
                result.entities.insert(it, entry);
            }
            continue;
        }
        if (!present)
        {
            return core::makeError(core::ErrorCode::kMalformedPacket,
                                   "Delta patches unknown entity " + std::to_string(entry.entityId));
        }
        patch(*it, entry);
    }
    return result;
}

} // namespace rift::net::replication
