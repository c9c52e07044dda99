/**
 * @file Bitstream.hpp
 * @brief Bit-level serialization stream for deterministic networking.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_PROTOCOL_BITSTREAM_HPP
    #define RIFT_NET_PROTOCOL_BITSTREAM_HPP

#include <rift/core/Expected.hpp>
#include <rift/core/NonCopyable.hpp>
#include <rift/core/Types.hpp>

#include <span>
#include <vector>

namespace rift::net::protocol {

/**
 * @class Bitstream
 * @brief Compact bit-level read/write stream.
 *
 * Values are stored most-significant bit first, so a stream written with
 * whole bytes and words is plain big-endian on the wire.  Every read that
 * runs past the end fails with kMalformedPacket.
 */
class Bitstream final : public core::NonCopyable<Bitstream>
{
public:
    /** @brief Constructs an empty writable bitstream. */
    Bitstream() noexcept;

    /**
     * @brief Constructs a read-only bitstream over a copy of @p data.
     * @param data Raw bytes; every bit is readable.
     */
    explicit Bitstream(std::span<const core::byte> data);

    ~Bitstream();

    // --------------------------------------------------------------------- //
    //  Write                                                                 //
    // --------------------------------------------------------------------- //

    /**
     * @brief Writes the lower @p bitCount bits of @p value.
     * @param bitCount Number of bits to write (1-32).
     */
    void writeBits(core::u32 value, core::u32 bitCount);

    void writeBool(bool value);
    void writeU8(core::u8 value);
    void writeU16(core::u16 value);
    void writeU32(core::u32 value);
    void writeI32(core::i32 value);

    /** @brief Writes the IEEE-754 bit pattern of @p value. */
    void writeF32(core::f32 value);

    void writeBytes(std::span<const core::byte> bytes);

    // --------------------------------------------------------------------- //
    //  Read                                                                  //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<core::u32> readBits(core::u32 bitCount);
    [[nodiscard]] core::Expected<bool>      readBool();
    [[nodiscard]] core::Expected<core::u8>  readU8();
    [[nodiscard]] core::Expected<core::u16> readU16();
    [[nodiscard]] core::Expected<core::u32> readU32();
    [[nodiscard]] core::Expected<core::i32> readI32();

    /**
     * @brief Reads a 32-bit float.  NaN and infinities are rejected as
     *        malformed since no simulation value may carry them.
     */
    [[nodiscard]] core::Expected<core::f32> readF32();

    [[nodiscard]] core::Expected<std::vector<core::byte>> readBytes(core::u32 count);

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::u32 bitsWritten() const noexcept;
    [[nodiscard]] core::u32 bitsRemaining() const noexcept;

    /** @brief Whole bytes left unread (partial trailing bits excluded). */
    [[nodiscard]] core::u32 bytesRemaining() const noexcept;

    [[nodiscard]] std::span<const core::byte> data() const noexcept;

    /** @brief Moves the written buffer out, leaving the stream empty. */
    [[nodiscard]] std::vector<core::byte> release() noexcept;

    /** @brief Resets read/write cursors to the beginning. */
    void reset() noexcept;

private:
    std::vector<core::byte> _buffer;
    core::u32               _writeBit{0};
    core::u32               _readBit{0};
    core::u32               _totalBits{0};
    bool                    _readOnly{false};
};

} // namespace rift::net::protocol

#endif // RIFT_NET_PROTOCOL_BITSTREAM_HPP
