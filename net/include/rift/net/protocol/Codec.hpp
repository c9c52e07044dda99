/**
 * @file Codec.hpp
 * @brief Packet framing and payload encoders / decoders.
 *
 * Every decoder is total: truncated input, trailing bytes, a bad magic or
 * version, an unknown packet type or enum value all yield
 * ErrorCode::kMalformedPacket, never undefined behaviour.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_PROTOCOL_CODEC_HPP
    #define RIFT_NET_PROTOCOL_CODEC_HPP

#include <rift/net/protocol/Messages.hpp>
#include <rift/net/protocol/Protocol.hpp>
#include <rift/core/Expected.hpp>
#include <rift/core/Types.hpp>

#include <span>
#include <vector>

namespace rift::net::protocol {

/** @brief A framed packet split into header and payload. */
struct Packet
{
    PacketHeader            header{};
    std::vector<core::byte> payload;
};

// ========================================================================== //
//  Framing                                                                   //
// ========================================================================== //

[[nodiscard]] std::vector<core::byte> encodePacket(PacketType type, core::u32 sequence,
                                                   std::span<const core::byte> payload,
                                                   core::u8 flags = 0);

/**
 * @brief Splits a datagram into header and payload.
 *
 * The datagram must be exactly header + payloadSize bytes long.
 */
[[nodiscard]] core::Expected<Packet> decodePacket(std::span<const core::byte> datagram);

// ========================================================================== //
//  Payloads                                                                  //
// ========================================================================== //

[[nodiscard]] std::vector<core::byte> encodeInput(const InputCommand& command);
[[nodiscard]] core::Expected<InputCommand> decodeInput(std::span<const core::byte> payload);

[[nodiscard]] std::vector<core::byte> encodeConnectAccepted(const ConnectAccepted& message);
[[nodiscard]] core::Expected<ConnectAccepted> decodeConnectAccepted(std::span<const core::byte> payload);

[[nodiscard]] std::vector<core::byte> encodeSnapshotAck(const SnapshotAck& message);
[[nodiscard]] core::Expected<SnapshotAck> decodeSnapshotAck(std::span<const core::byte> payload);

/**
 * @brief Encodes a delta.  Entries write only the component payloads whose
 *        bit is set in their mask, in ReplicatedField bit order.
 * @return kOutOfRange when a count does not fit its u16 field or the payload
 *         exceeds kMaxPayloadSize.
 */
[[nodiscard]] core::Expected<std::vector<core::byte>> encodeSnapshotDelta(const SnapshotDelta& delta);
[[nodiscard]] core::Expected<SnapshotDelta> decodeSnapshotDelta(std::span<const core::byte> payload);

/** @brief Connect and Disconnect carry no payload; anything else is malformed. */
[[nodiscard]] core::Expected<void> expectEmpty(std::span<const core::byte> payload);

} // namespace rift::net::protocol

#endif // RIFT_NET_PROTOCOL_CODEC_HPP
