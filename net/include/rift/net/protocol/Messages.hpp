/**
 * @file Messages.hpp
 * @brief Payload records carried by each PacketType.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_PROTOCOL_MESSAGES_HPP
    #define RIFT_NET_PROTOCOL_MESSAGES_HPP

#include <rift/ecs/Components.hpp>
#include <rift/math/Vec2.hpp>
#include <rift/core/Types.hpp>

#include <vector>

namespace rift::net::protocol {

/**
 * @struct InputCommand
 * @brief One tick of player intent.  Sequences are monotonic per client.
 */
struct InputCommand
{
    core::Sequence sequence{0};
    core::Tick     tick{0};
    math::Vec2f    move{};
    core::u16      actionFlags{ecs::kActionNone};

    [[nodiscard]] bool operator==(const InputCommand&) const = default;
};

struct ConnectAccepted
{
    core::ClientId clientId{core::kNoClient};
    /// Server-side id of the character spawned for this client.
    core::u32      entityId{0};
    core::Tick     serverTick{0};
    core::u16      tickRate{0};

    [[nodiscard]] bool operator==(const ConnectAccepted&) const = default;
};

struct SnapshotAck
{
    core::Tick tick{0};
};

/**
 * @enum ReplicatedField
 * @brief Bits of an entry's component mask.
 *
 * @c kFieldReplace marks an entry that carries the entity's whole
 * replicated state: a newly visible entity, or one that lost a component
 * since the baseline.  Without it the entry patches the baseline.
 */
enum ReplicatedField : core::u8
{
    kFieldNone      = 0,
    kFieldTransform = 1u << 0,
    kFieldHitbox    = 1u << 1,
    kFieldBody      = 1u << 2,
    kFieldCharacter = 1u << 3,
    kFieldOwner     = 1u << 4,
    kFieldReplace   = 1u << 7,
};

inline constexpr core::u8 kComponentFieldMask =
    kFieldTransform | kFieldHitbox | kFieldBody | kFieldCharacter | kFieldOwner;

/** @brief Replicated part of ecs::Character (the input buffer stays local). */
struct CharacterState
{
    core::i32        health{0};
    core::i32        maxHealth{0};
    ecs::ActionState state{ecs::ActionState::Idle};
    core::u32        stateTicks{0};
    core::i8         facing{1};
    core::u32        invulnerableTicks{0};
    bool             attackConnected{false};

    [[nodiscard]] bool operator==(const CharacterState&) const = default;
};

/**
 * @struct EntityState
 * @brief Replicated state of one entity.  Only the fields whose bit is set
 *        in @c mask are meaningful.
 */
struct EntityState
{
    core::u32      entityId{0};
    core::u8       mask{kFieldNone};
    ecs::Transform transform{};
    ecs::Hitbox    hitbox{};
    ecs::Body      body{};
    CharacterState character{};
    ecs::Owner     owner{};

    [[nodiscard]] bool has(ReplicatedField field) const noexcept { return (mask & field) != 0; }
};

/**
 * @struct SnapshotDelta
 * @brief World state at @c tick relative to the client-acknowledged
 *        @c baseTick (0 = full snapshot).
 */
struct SnapshotDelta
{
    core::Tick               tick{0};
    core::Tick               baseTick{0};
    core::Sequence           ackedInput{0};
    std::vector<EntityState> entries;
    std::vector<core::u32>   removed;

    [[nodiscard]] bool isFull() const noexcept { return baseTick == 0; }
};

} // namespace rift::net::protocol

#endif // RIFT_NET_PROTOCOL_MESSAGES_HPP
