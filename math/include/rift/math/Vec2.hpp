/**
 * @file Vec2.hpp
 * @brief 2-component vector template for the planar simulation.
 *
 * Parameterised on the scalar type so that the same code operates on the
 * simulation's float positions and on integer cell coordinates.
 *
 * @tparam T Scalar type satisfying rift::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RIFT_MATH_VEC2_HPP
    #define RIFT_MATH_VEC2_HPP

    #include <rift/core/Concepts.hpp>

namespace rift::math {

template <core::Arithmetic T>
struct Vec2 final {
    T x{};
    T y{};

    constexpr Vec2() = default;
    constexpr Vec2(T x, T y);

    [[nodiscard]] constexpr Vec2 operator+(Vec2 rhs) const;
    [[nodiscard]] constexpr Vec2 operator-(Vec2 rhs) const;
    [[nodiscard]] constexpr Vec2 operator*(T scalar)  const;
    [[nodiscard]] constexpr Vec2 operator/(T scalar)  const;
    [[nodiscard]] constexpr Vec2 operator-()          const;

    constexpr Vec2& operator+=(Vec2 rhs);
    constexpr Vec2& operator-=(Vec2 rhs);
    constexpr Vec2& operator*=(T scalar);

    [[nodiscard]] constexpr bool operator==(const Vec2&) const = default;

    [[nodiscard]] constexpr T    dot(Vec2 rhs)      const;
    [[nodiscard]] constexpr T    lengthSquared()    const;
    [[nodiscard]] T              length()           const;
    [[nodiscard]] Vec2           normalize()        const;

    static constexpr Vec2 zero();
    static constexpr Vec2 unitX();
    static constexpr Vec2 unitY();
};

/**
 * @brief Linear blend between @p a and @p b (t in [0, 1]).
 */
template <core::Arithmetic T>
[[nodiscard]] constexpr Vec2<T> lerp(Vec2<T> a, Vec2<T> b, T t);

/**
 * @brief Euclidean distance between two points.
 */
template <core::Arithmetic T>
[[nodiscard]] T distance(Vec2<T> a, Vec2<T> b);

using Vec2f = Vec2<float>;
using Vec2i = Vec2<int>;

} // namespace rift::math

    #include "Vec2.inl"

#endif // RIFT_MATH_VEC2_HPP
