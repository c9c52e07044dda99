/**
 * @file AABB.inl
 * @brief Inline implementations of AABB template methods.
 *
 * @note This file is automatically included at the end of AABB.hpp.
 *       Do not include it directly.
 */

namespace rift::math {

template <core::Arithmetic T>
constexpr AABB<T>::AABB(Vec2<T> mn, Vec2<T> mx) : min(mn), max(mx) {}

template <core::Arithmetic T>
constexpr AABB<T> AABB<T>::fromCenter(Vec2<T> c, Vec2<T> size)
{
    const Vec2<T> half = size / T(2);
    return AABB{c - half, c + half};
}

template <core::Arithmetic T>
constexpr bool AABB<T>::contains(Vec2<T> point) const
{
    return point.x >= min.x && point.x <= max.x
        && point.y >= min.y && point.y <= max.y;
}

template <core::Arithmetic T>
constexpr bool AABB<T>::intersects(AABB other) const
{
    return min.x <= other.max.x && max.x >= other.min.x
        && min.y <= other.max.y && max.y >= other.min.y;
}

template <core::Arithmetic T>
constexpr bool AABB<T>::overlaps(AABB other) const
{
    return min.x < other.max.x && max.x > other.min.x
        && min.y < other.max.y && max.y > other.min.y;
}

template <core::Arithmetic T>
constexpr AABB<T> AABB<T>::merge(AABB other) const
{
    auto lo = [](T a, T b) { return (a < b) ? a : b; };
    auto hi = [](T a, T b) { return (a > b) ? a : b; };
    return AABB{
        Vec2<T>(lo(min.x, other.min.x), lo(min.y, other.min.y)),
        Vec2<T>(hi(max.x, other.max.x), hi(max.y, other.max.y))};
}

template <core::Arithmetic T>
constexpr AABB<T> AABB<T>::expand(T margin) const
{
    Vec2<T> m(margin, margin);
    return AABB{min - m, max + m};
}

template <core::Arithmetic T>
constexpr AABB<T> AABB<T>::translate(Vec2<T> delta) const
{
    return AABB{min + delta, max + delta};
}

template <core::Arithmetic T>
constexpr Vec2<T> AABB<T>::center() const
{
    return Vec2<T>((min.x + max.x) / T(2), (min.y + max.y) / T(2));
}

template <core::Arithmetic T>
constexpr Vec2<T> AABB<T>::halfExtents() const
{
    return Vec2<T>((max.x - min.x) / T(2), (max.y - min.y) / T(2));
}

template <core::Arithmetic T>
constexpr T AABB<T>::area() const
{
    auto ext = max - min;
    return ext.x * ext.y;
}

} // namespace rift::math
