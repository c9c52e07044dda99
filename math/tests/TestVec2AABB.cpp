/**
 * @file TestVec2AABB.cpp
 * @brief Unit tests for math::Vec2 and math::AABB.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rift/math/AABB.hpp"

namespace rift::math {

using Catch::Matchers::WithinAbs;

TEST_CASE("Vec2 arithmetic", "[math][vec2]")
{
    const Vec2f a{3.0f, 4.0f};
    const Vec2f b{1.0f, -2.0f};

    REQUIRE(a + b == Vec2f{4.0f, 2.0f});
    REQUIRE(a - b == Vec2f{2.0f, 6.0f});
    REQUIRE(a * 2.0f == Vec2f{6.0f, 8.0f});
    REQUIRE(a.dot(b) == -5.0f);
    REQUIRE_THAT(a.length(), WithinAbs(5.0, 1e-6));
    REQUIRE_THAT(a.normalize().length(), WithinAbs(1.0, 1e-6));
    REQUIRE(Vec2f::zero().normalize() == Vec2f::zero());
}

TEST_CASE("Vec2 lerp and distance", "[math][vec2]")
{
    const Vec2f a{0.0f, 0.0f};
    const Vec2f b{10.0f, -20.0f};

    REQUIRE(lerp(a, b, 0.0f) == a);
    REQUIRE(lerp(a, b, 1.0f) == b);
    REQUIRE(lerp(a, b, 0.25f) == Vec2f{2.5f, -5.0f});
    REQUIRE_THAT(distance(Vec2f{1.0f, 1.0f}, Vec2f{4.0f, 5.0f}), WithinAbs(5.0, 1e-6));
}

TEST_CASE("AABB overlap is strict, intersection is closed", "[math][aabb]")
{
    const AABBf a{{0.0f, 0.0f}, {10.0f, 10.0f}};
    const AABBf touching{{10.0f, 0.0f}, {20.0f, 10.0f}};
    const AABBf inside{{2.0f, 2.0f}, {4.0f, 4.0f}};
    const AABBf apart{{11.0f, 11.0f}, {12.0f, 12.0f}};

    REQUIRE(a.intersects(touching));
    REQUIRE_FALSE(a.overlaps(touching));
    REQUIRE(a.overlaps(inside));
    REQUIRE_FALSE(a.intersects(apart));
    REQUIRE(a.contains({10.0f, 5.0f}));
}

TEST_CASE("AABB from centre", "[math][aabb]")
{
    const AABBf box = AABBf::fromCenter({5.0f, 5.0f}, {4.0f, 2.0f});

    REQUIRE(box.min == Vec2f{3.0f, 4.0f});
    REQUIRE(box.max == Vec2f{7.0f, 6.0f});
    REQUIRE(box.center() == Vec2f{5.0f, 5.0f});
    REQUIRE(box.halfExtents() == Vec2f{2.0f, 1.0f});
    REQUIRE(box.area() == 8.0f);
    REQUIRE(box.translate({1.0f, 0.0f}).min == Vec2f{4.0f, 4.0f});
}

} // namespace rift::math
