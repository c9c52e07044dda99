/**
 * @file TestProtocol.cpp
 * @brief Unit tests for net::protocol Bitstream, framing and payload codecs.
 */

#include <catch2/catch_test_macros.hpp>

#include "rift/net/protocol/Bitstream.hpp"
#include "rift/net/protocol/Codec.hpp"

#include <limits>

namespace rift::net::protocol {

namespace {

std::vector<core::byte> inputPacket()
{
    const InputCommand command{.sequence = 3, .tick = 40, .move = {1.0f, 0.0f}, .actionFlags = ecs::kActionJump};
    return encodePacket(PacketType::Input, 11, encodeInput(command));
}

EntityState characterEntry(core::u32 id)
{
    EntityState entry;
    entry.entityId = id;
    entry.mask     = kFieldReplace | kFieldTransform | kFieldCharacter;
    entry.transform.position = {100.0f, 24.0f};
    entry.character.health    = 80;
    entry.character.maxHealth = 100;
    entry.character.state     = ecs::ActionState::Dash;
    entry.character.facing    = -1;
    return entry;
}

} // namespace

// ========================================================================== //
//  Bitstream                                                                 //
// ========================================================================== //

TEST_CASE("Bitstream packs mixed widths most significant bit first", "[net][bitstream]")
{
    Bitstream out;
    out.writeBits(0b101, 3);
    out.writeBool(true);
    out.writeBits(0b0110, 4);
    out.writeU16(0xBEEF);
    out.writeF32(-2.5f);

    REQUIRE(out.bitsWritten() == 8 + 16 + 32);
    REQUIRE(out.data()[0] == core::byte{0b10110110});

    Bitstream in{out.data()};
    REQUIRE(in.readBits(3).value() == 0b101);
    REQUIRE(in.readBool().value());
    REQUIRE(in.readBits(4).value() == 0b0110);
    REQUIRE(in.readU16().value() == 0xBEEF);
    REQUIRE(in.readF32().value() == -2.5f);
    REQUIRE(in.bitsRemaining() == 0);
}

TEST_CASE("Bitstream reports underflow as a malformed packet", "[net][bitstream]")
{
    Bitstream out;
    out.writeU16(7);

    Bitstream in{out.data()};
    auto value = in.readU32();
    REQUIRE_FALSE(value.has_value());
    REQUIRE(value.error().code() == core::ErrorCode::kMalformedPacket);
}

TEST_CASE("Bitstream refuses non-finite floats", "[net][bitstream]")
{
    Bitstream out;
    out.writeU32(0x7FC00000u); // quiet NaN

    Bitstream in{out.data()};
    REQUIRE_FALSE(in.readF32().has_value());
}

// ========================================================================== //
//  Framing                                                                   //
// ========================================================================== //

TEST_CASE("Packet header carries type, sequence and payload", "[net][codec]")
{
    const auto bytes = inputPacket();
    REQUIRE(bytes.size() == kHeaderSize + 18);
    REQUIRE(bytes[0] == core::byte{'R'});
    REQUIRE(bytes[3] == core::byte{'T'});

    auto packet = decodePacket(bytes);
    REQUIRE(packet.has_value());
    REQUIRE(packet->header.type == PacketType::Input);
    REQUIRE(packet->header.sequence == 11);
    REQUIRE(packet->header.payloadSize == 18);

    auto command = decodeInput(packet->payload);
    REQUIRE(command.has_value());
    REQUIRE(command->sequence == 3);
    REQUIRE(command->tick == 40);
    REQUIRE(command->move.x == 1.0f);
    REQUIRE(command->actionFlags == ecs::kActionJump);
}

TEST_CASE("Malformed datagrams are rejected", "[net][codec]")
{
    auto bytes = inputPacket();

    SECTION("shorter than the header")
    {
        bytes.resize(kHeaderSize - 1);
    }
    SECTION("bad magic")
    {
        bytes[0] = core::byte{'X'};
    }
    SECTION("unsupported version")
    {
        bytes[4] = core::byte{9};
    }
    SECTION("unknown packet type")
    {
        bytes[5] = core::byte{0x7F};
    }
    SECTION("truncated payload")
    {
        bytes.pop_back();
    }
    SECTION("extra bytes after payload")
    {
        bytes.push_back(core::byte{0});
    }

    auto packet = decodePacket(bytes);
    REQUIRE_FALSE(packet.has_value());
    REQUIRE(packet.error().code() == core::ErrorCode::kMalformedPacket);
}

TEST_CASE("Control packets must be empty", "[net][codec]")
{
    const std::vector<core::byte> none;
    const std::vector<core::byte> one{core::byte{1}};
    REQUIRE(expectEmpty(none).has_value());
    REQUIRE_FALSE(expectEmpty(one).has_value());
}

// ========================================================================== //
//  Payloads                                                                  //
// ========================================================================== //

TEST_CASE("Input payload validation", "[net][codec]")
{
    auto payload = encodeInput({.sequence = 1, .tick = 1, .move = {}, .actionFlags = ecs::kActionNone});

    SECTION("trailing bytes")
    {
        payload.push_back(core::byte{0});
        REQUIRE_FALSE(decodeInput(payload).has_value());
    }
    SECTION("unknown action bits")
    {
        payload = encodeInput({.sequence = 1, .tick = 1, .move = {}, .actionFlags = 0x80});
        REQUIRE_FALSE(decodeInput(payload).has_value());
    }
    SECTION("non-finite move")
    {
        payload = encodeInput({.sequence = 1, .tick = 1,
                               .move = {std::numeric_limits<core::f32>::infinity(), 0.0f}});
        REQUIRE_FALSE(decodeInput(payload).has_value());
    }
}

TEST_CASE("ConnectAccepted rejects a zero tick rate", "[net][codec]")
{
    const ConnectAccepted good{.clientId = 2, .entityId = 9, .serverTick = 100, .tickRate = 60};
    auto decoded = decodeConnectAccepted(encodeConnectAccepted(good));
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == good);

    const ConnectAccepted bad{.clientId = 2, .entityId = 9, .serverTick = 100, .tickRate = 0};
    REQUIRE_FALSE(decodeConnectAccepted(encodeConnectAccepted(bad)).has_value());
}

TEST_CASE("Snapshot payload keeps sparse fields and removals", "[net][codec]")
{
    SnapshotDelta delta;
    delta.tick       = 12;
    delta.baseTick   = 10;
    delta.ackedInput = 5;

    EntityState moved;
    moved.entityId = 4;
    moved.mask     = kFieldTransform;
    moved.transform.position = {3.0f, 4.0f};
    delta.entries.push_back(moved);
    delta.entries.push_back(characterEntry(7));
    delta.removed.push_back(2);

    auto decoded = decodeSnapshotDelta(encodeSnapshotDelta(delta).value());
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->tick == 12);
    REQUIRE(decoded->baseTick == 10);
    REQUIRE(decoded->ackedInput == 5);
    REQUIRE(decoded->entries.size() == 2);
    REQUIRE(decoded->entries[0].mask == kFieldTransform);
    REQUIRE(decoded->entries[0].transform == moved.transform);
    REQUIRE(decoded->entries[1].character == delta.entries[1].character);
    REQUIRE(decoded->entries[1].character.facing == -1);
    REQUIRE(decoded->removed == std::vector<core::u32>{2});
}

TEST_CASE("Snapshot payload validation", "[net][codec]")
{
    SnapshotDelta delta;
    delta.tick = 20;

    SECTION("unknown action state")
    {
        auto entry = characterEntry(1);
        entry.character.state = static_cast<ecs::ActionState>(42);
        delta.entries.push_back(entry);
    }
    SECTION("baseline not older than the snapshot")
    {
        delta.baseTick = 20;
    }
    SECTION("full snapshot entry without replace bit")
    {
        auto entry = characterEntry(1);
        entry.mask = kFieldTransform;
        delta.entries.push_back(entry);
    }
    SECTION("duplicate entity")
    {
        delta.entries.push_back(characterEntry(1));
        delta.entries.push_back(characterEntry(1));
    }
    SECTION("hitbox layer out of range")
    {
        auto entry = characterEntry(1);
        entry.mask |= kFieldHitbox;
        entry.hitbox.layer = 40;
        delta.entries.push_back(entry);
    }

    auto decoded = decodeSnapshotDelta(encodeSnapshotDelta(delta).value());
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code() == core::ErrorCode::kMalformedPacket);
}

TEST_CASE("Snapshot payload rejects trailing data", "[net][codec]")
{
    SnapshotDelta delta;
    delta.tick = 3;
    delta.entries.push_back(characterEntry(1));

    auto payload = encodeSnapshotDelta(delta).value();
    REQUIRE(decodeSnapshotDelta(payload).has_value());

    payload.push_back(core::byte{0});
    REQUIRE_FALSE(decodeSnapshotDelta(payload).has_value());
}

TEST_CASE("Snapshots larger than one datagram are refused", "[net][codec]")
{
    SnapshotDelta delta;
    delta.tick = 9;
    for (core::u32 id = 1; id <= 3000; ++id)
    {
        delta.entries.push_back(characterEntry(id));
    }

    auto encoded = encodeSnapshotDelta(delta);
    REQUIRE_FALSE(encoded.has_value());
    REQUIRE(encoded.error().code() == core::ErrorCode::kOutOfRange);

    SECTION("a count that overflows its field")
    {
        SnapshotDelta removals;
        removals.tick = 9;
        removals.removed.assign(70000, 1u);
        auto refused = encodeSnapshotDelta(removals);
        REQUIRE_FALSE(refused.has_value());
        REQUIRE(refused.error().code() == core::ErrorCode::kOutOfRange);
    }

    SECTION("trimmed back under the limit")
    {
        delta.entries.resize(100);
        auto trimmed = encodeSnapshotDelta(delta);
        REQUIRE(trimmed.has_value());
        REQUIRE(trimmed->size() <= kMaxPayloadSize);
    }
}

} // namespace rift::net::protocol
