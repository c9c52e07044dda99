/**
 * @file Codec.cpp
 * @brief Packet framing and payload codec implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/protocol/Codec.hpp>
#include <rift/net/protocol/Bitstream.hpp>
#include <rift/core/Constants.hpp>

#include <limits>
#include <string>
#include <unordered_set>

namespace rift::net::protocol {

namespace {

[[nodiscard]] auto malformed(std::string message)
{
    return core::makeError(core::ErrorCode::kMalformedPacket, std::move(message));
}

[[nodiscard]] core::Expected<void> expectConsumed(const Bitstream& stream)
{
    if (stream.bitsRemaining() != 0)
    {
        return malformed("Trailing bytes after payload");
    }
    return {};
}

// -------------------------------------------------------------------------- //
//  Field helpers                                                             //
// -------------------------------------------------------------------------- //

void writeVec2(Bitstream& out, math::Vec2f v)
{
    out.writeF32(v.x);
    out.writeF32(v.y);
}

[[nodiscard]] core::Expected<math::Vec2f> readVec2(Bitstream& in)
{
    const auto x = RIFT_TRY(in.readF32());
    const auto y = RIFT_TRY(in.readF32());
    return math::Vec2f{x, y};
}

void writeTransform(Bitstream& out, const ecs::Transform& t)
{
    writeVec2(out, t.position);
    writeVec2(out, t.velocity);
    out.writeF32(t.rotation);
    writeVec2(out, t.scale);
}

[[nodiscard]] core::Expected<ecs::Transform> readTransform(Bitstream& in)
{
    ecs::Transform t;
    t.position = RIFT_TRY(readVec2(in));
    t.velocity = RIFT_TRY(readVec2(in));
    t.rotation = RIFT_TRY(in.readF32());
    t.scale    = RIFT_TRY(readVec2(in));
    return t;
}

void writeHitbox(Bitstream& out, const ecs::Hitbox& h)
{
    writeVec2(out, h.size);
    writeVec2(out, h.offset);
    out.writeU8(h.layer);
    out.writeU8(static_cast<core::u8>(h.mode));
}

[[nodiscard]] core::Expected<ecs::Hitbox> readHitbox(Bitstream& in)
{
    ecs::Hitbox h;
    h.size   = RIFT_TRY(readVec2(in));
    h.offset = RIFT_TRY(readVec2(in));
    h.layer  = RIFT_TRY(in.readU8());
    const auto mode = RIFT_TRY(in.readU8());
    if (h.layer >= core::kCollisionLayerCount)
    {
        return malformed("Hitbox layer out of range");
    }
    if (mode > static_cast<core::u8>(ecs::HitboxMode::Trigger))
    {
        return malformed("Unknown hitbox mode " + std::to_string(mode));
    }
    h.mode = static_cast<ecs::HitboxMode>(mode);
    return h;
}

void writeBody(Bitstream& out, const ecs::Body& b)
{
    out.writeF32(b.mass);
    out.writeBool(b.isStatic);
    out.writeF32(b.gravityScale);
    out.writeBool(b.grounded);
}

[[nodiscard]] core::Expected<ecs::Body> readBody(Bitstream& in)
{
    ecs::Body b;
    b.mass         = RIFT_TRY(in.readF32());
    b.isStatic     = RIFT_TRY(in.readBool());
    b.gravityScale = RIFT_TRY(in.readF32());
    b.grounded     = RIFT_TRY(in.readBool());
    return b;
}

void writeCharacter(Bitstream& out, const CharacterState& c)
{
    out.writeI32(c.health);
    out.writeI32(c.maxHealth);
    out.writeU8(static_cast<core::u8>(c.state));
    out.writeU32(c.stateTicks);
    out.writeBool(c.facing < 0);
    out.writeU32(c.invulnerableTicks);
    out.writeBool(c.attackConnected);
}

[[nodiscard]] core::Expected<CharacterState> readCharacter(Bitstream& in)
{
    CharacterState c;
    c.health    = RIFT_TRY(in.readI32());
    c.maxHealth = RIFT_TRY(in.readI32());
    const auto state = RIFT_TRY(in.readU8());
    if (state >= static_cast<core::u8>(ecs::ActionState::Count))
    {
        return malformed("Unknown action state " + std::to_string(state));
    }
    c.state             = static_cast<ecs::ActionState>(state);
    c.stateTicks        = RIFT_TRY(in.readU32());
    c.facing            = RIFT_TRY(in.readBool()) ? core::i8{-1} : core::i8{1};
    c.invulnerableTicks = RIFT_TRY(in.readU32());
    c.attackConnected   = RIFT_TRY(in.readBool());
    return c;
}

void writeEntry(Bitstream& out, const EntityState& entry)
{
    out.writeU32(entry.entityId);
    out.writeU8(entry.mask);
    if (entry.has(kFieldTransform)) writeTransform(out, entry.transform);
    if (entry.has(kFieldHitbox))    writeHitbox(out, entry.hitbox);
    if (entry.has(kFieldBody))      writeBody(out, entry.body);
    if (entry.has(kFieldCharacter)) writeCharacter(out, entry.character);
    if (entry.has(kFieldOwner))     out.writeU32(entry.owner.clientId);
}

[[nodiscard]] core::Expected<EntityState> readEntry(Bitstream& in)
{
    EntityState entry;
    entry.entityId = RIFT_TRY(in.readU32());
    entry.mask     = RIFT_TRY(in.readU8());
    if ((entry.mask & ~(kComponentFieldMask | kFieldReplace)) != 0)
    {
        return malformed("Unknown component bits in entry mask");
    }
    if (entry.has(kFieldTransform)) entry.transform       = RIFT_TRY(readTransform(in));
    if (entry.has(kFieldHitbox))    entry.hitbox          = RIFT_TRY(readHitbox(in));
    if (entry.has(kFieldBody))      entry.body            = RIFT_TRY(readBody(in));
    if (entry.has(kFieldCharacter)) entry.character       = RIFT_TRY(readCharacter(in));
    if (entry.has(kFieldOwner))     entry.owner.clientId  = RIFT_TRY(in.readU32());
    return entry;
}

} // namespace

// ========================================================================== //
//  Framing                                                                   //
// ========================================================================== //

std::vector<core::byte> encodePacket(PacketType type, core::u32 sequence,
                                     std::span<const core::byte> payload, core::u8 flags)
{
    Bitstream out;
    out.writeU32(kProtocolMagic);
    out.writeU8(kProtocolVersion);
    out.writeU8(static_cast<core::u8>(type));
    out.writeU8(flags);
    out.writeU8(0);
    out.writeU32(sequence);
    out.writeU32(static_cast<core::u32>(payload.size()));
    out.writeBytes(payload);
    return out.release();
}

core::Expected<Packet> decodePacket(std::span<const core::byte> datagram)
{
    if (datagram.size() < kHeaderSize)
    {
        return malformed("Datagram shorter than header");
    }

    Bitstream in{datagram.first(kHeaderSize)};
    Packet packet;
    packet.header.magic = RIFT_TRY(in.readU32());
    if (packet.header.magic != kProtocolMagic)
    {
        return malformed("Bad protocol magic");
    }
    packet.header.version = RIFT_TRY(in.readU8());
    if (packet.header.version != kProtocolVersion)
    {
        return malformed("Unsupported protocol version " + std::to_string(packet.header.version));
    }
    const auto type = RIFT_TRY(in.readU8());
    if (!isValidPacketType(type))
    {
        return malformed("Unknown packet type " + std::to_string(type));
    }
    packet.header.type        = static_cast<PacketType>(type);
    packet.header.flags       = RIFT_TRY(in.readU8());
    packet.header.padding     = RIFT_TRY(in.readU8());
    packet.header.sequence    = RIFT_TRY(in.readU32());
    packet.header.payloadSize = RIFT_TRY(in.readU32());

    if (packet.header.payloadSize != datagram.size() - kHeaderSize)
    {
        return malformed("Payload size mismatch: header says " +
                         std::to_string(packet.header.payloadSize) + ", got " +
                         std::to_string(datagram.size() - kHeaderSize));
    }

    const auto body = datagram.subspan(kHeaderSize);
    packet.payload.assign(body.begin(), body.end());
    return packet;
}

// ========================================================================== //
//  Payloads                                                                  //
// ========================================================================== //

std::vector<core::byte> encodeInput(const InputCommand& command)
{
    Bitstream out;
    out.writeU32(command.sequence);
    out.writeU32(command.tick);
    writeVec2(out, command.move);
    out.writeU16(command.actionFlags);
    return out.release();
}

core::Expected<InputCommand> decodeInput(std::span<const core::byte> payload)
{
    Bitstream in{payload};
    InputCommand command;
    command.sequence    = RIFT_TRY(in.readU32());
    command.tick        = RIFT_TRY(in.readU32());
    command.move        = RIFT_TRY(readVec2(in));
    command.actionFlags = RIFT_TRY(in.readU16());
    constexpr core::u16 known = ecs::kActionJump | ecs::kActionDash | ecs::kActionAttack;
    if ((command.actionFlags & ~known) != 0)
    {
        return malformed("Unknown action flags");
    }
    RIFT_TRY_VOID(expectConsumed(in));
    return command;
}

std::vector<core::byte> encodeConnectAccepted(const ConnectAccepted& message)
{
    Bitstream out;
    out.writeU32(message.clientId);
    out.writeU32(message.entityId);
    out.writeU32(message.serverTick);
    out.writeU16(message.tickRate);
    return out.release();
}

core::Expected<ConnectAccepted> decodeConnectAccepted(std::span<const core::byte> payload)
{
    Bitstream in{payload};
    ConnectAccepted message;
    message.clientId   = RIFT_TRY(in.readU32());
    message.entityId   = RIFT_TRY(in.readU32());
    message.serverTick = RIFT_TRY(in.readU32());
    message.tickRate   = RIFT_TRY(in.readU16());
    if (message.tickRate == 0)
    {
        return malformed("Zero tick rate");
    }
    RIFT_TRY_VOID(expectConsumed(in));
    return message;
}

std::vector<core::byte> encodeSnapshotAck(const SnapshotAck& message)
{
    Bitstream out;
    out.writeU32(message.tick);
    return out.release();
}

core::Expected<SnapshotAck> decodeSnapshotAck(std::span<const core::byte> payload)
{
    Bitstream in{payload};
    SnapshotAck message;
    message.tick = RIFT_TRY(in.readU32());
    RIFT_TRY_VOID(expectConsumed(in));
    return message;
}

core::Expected<std::vector<core::byte>> encodeSnapshotDelta(const SnapshotDelta& delta)
{
    constexpr core::usize kMaxCount = std::numeric_limits<core::u16>::max();
    if (delta.entries.size() > kMaxCount || delta.removed.size() > kMaxCount)
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               "Snapshot " + std::to_string(delta.tick) + " has " +
                               std::to_string(delta.entries.size()) + " entries and " +
                               std::to_string(delta.removed.size()) + " removals, limit " +
                               std::to_string(kMaxCount));
    }

    Bitstream out;
    out.writeU32(delta.tick);
    out.writeU32(delta.baseTick);
    out.writeU32(delta.ackedInput);
    out.writeU16(static_cast<core::u16>(delta.entries.size()));
    for (const auto& entry : delta.entries)
    {
        writeEntry(out, entry);
    }
    out.writeU16(static_cast<core::u16>(delta.removed.size()));
    for (const auto id : delta.removed)
    {
        out.writeU32(id);
    }

    // Booleans leave the stream off a byte boundary: zero-pad the last byte.
    while (out.bitsWritten() % 8 != 0)
    {
        out.writeBool(false);
    }

    auto bytes = out.release();
    if (bytes.size() > kMaxPayloadSize)
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               "Snapshot " + std::to_string(delta.tick) + " encodes to " +
                               std::to_string(bytes.size()) + " bytes, datagram limit " +
                               std::to_string(kMaxPayloadSize));
    }
    return bytes;
}

core::Expected<SnapshotDelta> decodeSnapshotDelta(std::span<const core::byte> payload)
{
    Bitstream in{payload};
    SnapshotDelta delta;
    delta.tick       = RIFT_TRY(in.readU32());
    delta.baseTick   = RIFT_TRY(in.readU32());
    delta.ackedInput = RIFT_TRY(in.readU32());
    if (delta.baseTick != 0 && delta.baseTick >= delta.tick)
    {
        return malformed("Delta baseline not older than its tick");
    }

    std::unordered_set<core::u32> seen;
    const auto count = RIFT_TRY(in.readU16());
    delta.entries.reserve(count);
    for (core::u16 i = 0; i < count; ++i)
    {
        auto entry = RIFT_TRY(readEntry(in));
        if (!seen.insert(entry.entityId).second)
        {
            return malformed("Duplicate entity in snapshot");
        }
        if (delta.isFull() && !entry.has(kFieldReplace))
        {
            return malformed("Full snapshot entry without replace bit");
        }
        delta.entries.push_back(entry);
    }

    const auto removedCount = RIFT_TRY(in.readU16());
    delta.removed.reserve(removedCount);
    for (core::u16 i = 0; i < removedCount; ++i)
    {
        delta.removed.push_back(RIFT_TRY(in.readU32()));
    }

    // Only the zero padding of the final byte may remain.
    if (in.bitsRemaining() >= 8)
    {
        return malformed("Trailing bytes after payload");
    }
    while (in.bitsRemaining() > 0)
    {
        if (RIFT_TRY(in.readBool()))
        {
            return malformed("Non-zero padding bits");
        }
    }
    return delta;
}

core::Expected<void> expectEmpty(std::span<const core::byte> payload)
{
    if (!payload.empty())
    {
        return malformed("Unexpected payload on control packet");
    }
    return {};
}

} // namespace rift::net::protocol
