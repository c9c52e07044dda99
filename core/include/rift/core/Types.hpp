/**
 * @file Types.hpp
 * @brief Primitive type aliases and simulation-wide identifier types.
 *
 * Provides fixed-width integer aliases, floating-point aliases, and the
 * small identifier types (ticks, client ids, input sequences) shared by
 * the simulation and the replication layer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RIFT_CORE_TYPES_HPP
    #define RIFT_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace rift::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

using byte = std::byte;

/** @brief Simulation tick counter (server authoritative, starts at 1). */
using Tick = u32;

/** @brief Transport-assigned client identifier. */
using ClientId = u32;

/** @brief Per-client monotonic input sequence number. */
using Sequence = u32;

/** @brief Sentinel meaning "no client" (server-owned entity). */
inline constexpr ClientId kNoClient = 0xFFFF'FFFFu;

} // namespace rift::core

#endif // RIFT_CORE_TYPES_HPP
