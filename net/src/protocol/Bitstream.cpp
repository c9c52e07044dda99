/**
 * @file Bitstream.cpp
 * @brief Bitstream implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/protocol/Bitstream.hpp>
#include <rift/core/Assert.hpp>

#include <bit>
#include <cmath>

namespace rift::net::protocol {

Bitstream::Bitstream() noexcept = default;

Bitstream::Bitstream(std::span<const core::byte> data)
    : _buffer{data.begin(), data.end()}
    , _writeBit{static_cast<core::u32>(data.size() * 8)}
    , _readBit{0}
    , _totalBits{static_cast<core::u32>(data.size() * 8)}
    , _readOnly{true}
{}

Bitstream::~Bitstream() = default;

// -------------------------------------------------------------------------- //
//  Write                                                                     //
// -------------------------------------------------------------------------- //

void Bitstream::writeBits(core::u32 value, core::u32 bitCount)
{
    RIFT_ASSERT(!_readOnly);
    RIFT_ASSERT(bitCount > 0 && bitCount <= 32);

    for (core::u32 i = 0; i < bitCount; ++i)
    {
        const core::u32 byteIdx = _writeBit >> 3;
        const core::u32 bitIdx  = _writeBit & 7;

        if (byteIdx >= static_cast<core::u32>(_buffer.size()))
        {
            _buffer.push_back(core::byte{0});
        }

        const core::u32 bit = (value >> (bitCount - 1 - i)) & 1u;
        auto& b = _buffer[byteIdx];
        b = static_cast<core::byte>(
            (static_cast<core::u8>(b) & ~(1u << (7 - bitIdx))) |
            (bit << (7 - bitIdx)));

        ++_writeBit;
    }

    _totalBits = _writeBit;
}

void Bitstream::writeBool(bool value)     { writeBits(value ? 1u : 0u, 1); }
void Bitstream::writeU8(core::u8 value)   { writeBits(value, 8); }
void Bitstream::writeU16(core::u16 value) { writeBits(value, 16); }
void Bitstream::writeU32(core::u32 value) { writeBits(value, 32); }
void Bitstream::writeI32(core::i32 value) { writeBits(std::bit_cast<core::u32>(value), 32); }
void Bitstream::writeF32(core::f32 value) { writeBits(std::bit_cast<core::u32>(value), 32); }

void Bitstream::writeBytes(std::span<const core::byte> bytes)
{
    for (auto b : bytes)
    {
        writeU8(static_cast<core::u8>(b));
    }
}

// -------------------------------------------------------------------------- //
//  Read                                                                      //
// -------------------------------------------------------------------------- //

core::Expected<core::u32> Bitstream::readBits(core::u32 bitCount)
{
    RIFT_ASSERT(bitCount > 0 && bitCount <= 32);

    if (_readBit + bitCount > _totalBits)
    {
        return core::makeError(core::ErrorCode::kMalformedPacket, "Bitstream underflow");
    }

    core::u32 result = 0;
    for (core::u32 i = 0; i < bitCount; ++i)
    {
        const core::u32 byteIdx = _readBit >> 3;
        const core::u32 bitIdx  = _readBit & 7;
        const core::u32 bit = (static_cast<core::u8>(_buffer[byteIdx]) >> (7 - bitIdx)) & 1u;
        result = (result << 1) | bit;
        ++_readBit;
    }

    return result;
}

core::Expected<bool> Bitstream::readBool()
{
    return readBits(1).transform([](core::u32 v) { return v != 0; });
}

core::Expected<core::u8> Bitstream::readU8()
{
    return readBits(8).transform([](core::u32 v) { return static_cast<core::u8>(v); });
}

core::Expected<core::u16> Bitstream::readU16()
{
    return readBits(16).transform([](core::u32 v) { return static_cast<core::u16>(v); });
}

core::Expected<core::u32> Bitstream::readU32()
{
    return readBits(32);
}

core::Expected<core::i32> Bitstream::readI32()
{
    return readBits(32).transform([](core::u32 v) { return std::bit_cast<core::i32>(v); });
}

core::Expected<core::f32> Bitstream::readF32()
{
    const auto bits = RIFT_TRY(readBits(32));
    const auto value = std::bit_cast<core::f32>(bits);
    if (!std::isfinite(value))
    {
        return core::makeError(core::ErrorCode::kMalformedPacket, "Non-finite float on the wire");
    }
    return value;
}

core::Expected<std::vector<core::byte>> Bitstream::readBytes(core::u32 count)
{
    if (count > bytesRemaining())
    {
        return core::makeError(core::ErrorCode::kMalformedPacket, "Bitstream underflow");
    }

    std::vector<core::byte> out;
    out.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
    {
        const auto b = RIFT_TRY(readU8());
        out.push_back(static_cast<core::byte>(b));
    }
    return out;
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

core::u32 Bitstream::bitsWritten() const noexcept { return _writeBit; }

core::u32 Bitstream::bitsRemaining() const noexcept
{
    return (_totalBits > _readBit) ? _totalBits - _readBit : 0;
}

core::u32 Bitstream::bytesRemaining() const noexcept { return bitsRemaining() / 8; }

std::span<const core::byte> Bitstream::data() const noexcept { return _buffer; }

std::vector<core::byte> Bitstream::release() noexcept
{
    auto out = std::move(_buffer);
    _buffer.clear();
    _writeBit  = 0;
    _readBit   = 0;
    _totalBits = 0;
    return out;
}

void Bitstream::reset() noexcept
{
    _readBit = 0;
    if (!_readOnly)
    {
        _writeBit  = 0;
        _totalBits = 0;
        _buffer.clear();
    }
}

} // namespace rift::net::protocol
