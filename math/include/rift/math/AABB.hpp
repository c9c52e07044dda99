/**
 * @file AABB.hpp
 * @brief Axis-Aligned Bounding Box for broadphase collision and spatial queries.
 *
 * @tparam T Scalar type satisfying rift::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RIFT_MATH_AABB_HPP
    #define RIFT_MATH_AABB_HPP

    #include "Vec2.hpp"
    #include <type_traits>

namespace rift::math {

template <core::Arithmetic T>
struct AABB final {
    Vec2<T> min{};
    Vec2<T> max{};

    constexpr AABB() = default;
    constexpr AABB(Vec2<T> min, Vec2<T> max);

    /** @brief Builds a box from its centre and full size. */
    [[nodiscard]] static constexpr AABB fromCenter(Vec2<T> center, Vec2<T> size);

    [[nodiscard]] constexpr bool    contains(Vec2<T> point)   const;

    /** @brief Closed-interval test: touching edges count as intersecting. */
    [[nodiscard]] constexpr bool    intersects(AABB other)    const;

    /** @brief Open-interval test: boxes must share a positive area. */
    [[nodiscard]] constexpr bool    overlaps(AABB other)      const;

    [[nodiscard]] constexpr AABB    merge(AABB other)         const;
    [[nodiscard]] constexpr AABB    expand(T margin)          const;
    [[nodiscard]] constexpr AABB    translate(Vec2<T> delta)  const;
    [[nodiscard]] constexpr Vec2<T> center()                  const;
    [[nodiscard]] constexpr Vec2<T> halfExtents()             const;
    [[nodiscard]] constexpr T       area()                    const;
};

using AABBf = AABB<float>;

} // namespace rift::math

#include "AABB.inl"

#endif // RIFT_MATH_AABB_HPP
