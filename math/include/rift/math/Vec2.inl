/**
 * @file Vec2.inl
 * @brief Inline implementation of Vec2 operations.
 * @see   Vec2.hpp
 */

#ifndef RIFT_MATH_VEC2_INL
    #define RIFT_MATH_VEC2_INL

#include <cmath>

namespace rift::math {

template <core::Arithmetic T>
constexpr Vec2<T>::Vec2(T x_, T y_) : x(x_), y(y_) {}

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator+(Vec2 rhs) const { return {x + rhs.x, y + rhs.y}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator-(Vec2 rhs) const { return {x - rhs.x, y - rhs.y}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator*(T s) const { return {x * s, y * s}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator/(T s) const { return {x / s, y / s}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator-() const { return {-x, -y}; }

template <core::Arithmetic T>
constexpr Vec2<T>& Vec2<T>::operator+=(Vec2 rhs) { x += rhs.x; y += rhs.y; return *this; }

template <core::Arithmetic T>
constexpr Vec2<T>& Vec2<T>::operator-=(Vec2 rhs) { x -= rhs.x; y -= rhs.y; return *this; }

template <core::Arithmetic T>
constexpr Vec2<T>& Vec2<T>::operator*=(T s) { x *= s; y *= s; return *this; }

template <core::Arithmetic T>
constexpr T Vec2<T>::dot(Vec2 rhs) const { return x * rhs.x + y * rhs.y; }

template <core::Arithmetic T>
constexpr T Vec2<T>::lengthSquared() const { return dot(*this); }

template <core::Arithmetic T>
T Vec2<T>::length() const
{
    return static_cast<T>(std::sqrt(static_cast<double>(lengthSquared())));
}

template <core::Arithmetic T>
Vec2<T> Vec2<T>::normalize() const
{
    const T len = length();
    if (len == T{})
        return *this;
    return *this / len;
}

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::zero()  { return {T{}, T{}}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::unitX() { return {T{1}, T{}}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::unitY() { return {T{}, T{1}}; }

template <core::Arithmetic T>
constexpr Vec2<T> lerp(Vec2<T> a, Vec2<T> b, T t)
{
    return a + (b - a) * t;
}

template <core::Arithmetic T>
T distance(Vec2<T> a, Vec2<T> b)
{
    return (b - a).length();
}

} // namespace rift::math

#endif // RIFT_MATH_VEC2_INL
