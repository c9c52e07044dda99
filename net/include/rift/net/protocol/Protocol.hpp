/**
 * @file Protocol.hpp
 * @brief Wire protocol constants, packet types, and header layout.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_PROTOCOL_PROTOCOL_HPP
    #define RIFT_NET_PROTOCOL_PROTOCOL_HPP

#include <rift/core/Constants.hpp>
#include <rift/core/Types.hpp>

#include <string_view>

namespace rift::net::protocol {

/**
 * @brief Magic bytes identifying Rift packets on the wire ("RIFT").
 */
static constexpr core::u32 kProtocolMagic = 0x52494654;

/** @brief Current protocol version. */
static constexpr core::u8 kProtocolVersion = 1;

/** @brief Encoded size of PacketHeader on the wire. */
static constexpr core::u32 kHeaderSize = 16;

/** @brief Largest payload that still fits one UDP datagram with its header. */
static constexpr core::u32 kMaxPayloadSize = core::kMaxDatagramSize - kHeaderSize;

/**
 * @enum PacketType
 * @brief Exhaustive list of packet types understood by client and server.
 */
enum class PacketType : core::u8
{
    Connect         = 0x01,
    ConnectAccepted = 0x02,
    Disconnect      = 0x03,
    Input           = 0x10,
    SnapshotAck     = 0x11,
    Snapshot        = 0x12
};

/** @brief True when @p raw names a known PacketType. */
[[nodiscard]] inline constexpr bool isValidPacketType(core::u8 raw) noexcept
{
    switch (static_cast<PacketType>(raw))
    {
        case PacketType::Connect:
        case PacketType::ConnectAccepted:
        case PacketType::Disconnect:
        case PacketType::Input:
        case PacketType::SnapshotAck:
        case PacketType::Snapshot:
            return true;
    }
    return false;
}

[[nodiscard]] inline constexpr std::string_view toString(PacketType type) noexcept
{
    switch (type)
    {
        case PacketType::Connect:         return "Connect";
        case PacketType::ConnectAccepted: return "ConnectAccepted";
        case PacketType::Disconnect:      return "Disconnect";
        case PacketType::Input:           return "Input";
        case PacketType::SnapshotAck:     return "SnapshotAck";
        case PacketType::Snapshot:        return "Snapshot";
    }
    return "Unknown";
}

/**
 * @struct PacketHeader
 * @brief Fixed-size header prepended to every packet.
 *
 * Layout (16 bytes, big-endian):
 *   [magic:4][version:1][type:1][flags:1][pad:1][seq:4][payloadSize:4]
 */
struct PacketHeader
{
    core::u32  magic{kProtocolMagic};
    core::u8   version{kProtocolVersion};
    PacketType type{PacketType::Connect};
    core::u8   flags{0};
    core::u8   padding{0};
    core::u32  sequence{0};
    core::u32  payloadSize{0};
};

static_assert(sizeof(PacketHeader) == kHeaderSize, "PacketHeader must be 16 bytes");

/**
 * @enum PacketFlag
 * @brief Bit-flags stored in PacketHeader::flags.
 */
enum class PacketFlag : core::u8
{
    None         = 0x00,
    FullSnapshot = 0x01
};

[[nodiscard]] inline constexpr core::u8 operator|(PacketFlag a, PacketFlag b) noexcept
{
    return static_cast<core::u8>(static_cast<core::u8>(a) | static_cast<core::u8>(b));
}

[[nodiscard]] inline constexpr bool hasFlag(core::u8 flags, PacketFlag f) noexcept
{
    return (flags & static_cast<core::u8>(f)) != 0;
}

} // namespace rift::net::protocol

#endif // RIFT_NET_PROTOCOL_PROTOCOL_HPP
