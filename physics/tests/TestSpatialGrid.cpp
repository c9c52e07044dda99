/**
 * @file TestSpatialGrid.cpp
 * @brief Unit tests for physics::SpatialGrid.
 */

#include <catch2/catch_test_macros.hpp>

#include "rift/physics/SpatialGrid.hpp"

#include <algorithm>
#include <random>
#include <vector>

namespace rift::physics {

namespace {

ecs::EntityId idOf(core::u32 slot) { return ecs::EntityId{0, slot}; }

} // namespace

TEST_CASE("SpatialGrid stores entities in every overlapped cell", "[physics][grid]")
{
    SpatialGrid grid{64.0f};

    const math::AABBf box{{60.0f, -10.0f}, {70.0f, 10.0f}};
    const auto cells = grid.cellsFor(box);

    REQUIRE(cells.size() == 4);
    REQUIRE(cells.front() == math::Vec2i{0, -1});
    REQUIRE(cells.back() == math::Vec2i{1, 0});

    grid.insert(idOf(1), box);
    REQUIRE(grid.count() == 1);
    REQUIRE(grid.queryRegion({{100.0f, 5.0f}, {110.0f, 6.0f}}).empty());
    REQUIRE(grid.queryRegion({{65.0f, 5.0f}, {66.0f, 6.0f}}) == std::vector<ecs::EntityId>{idOf(1)});
}

TEST_CASE("SpatialGrid update and remove", "[physics][grid]")
{
    SpatialGrid grid{32.0f};
    grid.insert(idOf(1), {{0.0f, 0.0f}, {10.0f, 10.0f}});
    grid.insert(idOf(2), {{5.0f, 5.0f}, {15.0f, 15.0f}});

    grid.update(idOf(1), {{500.0f, 500.0f}, {510.0f, 510.0f}});
    REQUIRE(grid.queryRegion({{0.0f, 0.0f}, {20.0f, 20.0f}}) == std::vector<ecs::EntityId>{idOf(2)});
    REQUIRE(grid.queryRegion({{505.0f, 505.0f}, {506.0f, 506.0f}}) == std::vector<ecs::EntityId>{idOf(1)});

    grid.remove(idOf(2));
    grid.remove(idOf(42));
    REQUIRE(grid.count() == 1);
    REQUIRE(grid.queryRegion({{0.0f, 0.0f}, {20.0f, 20.0f}}).empty());

    grid.clear();
    REQUIRE(grid.count() == 0);
}

TEST_CASE("SpatialGrid query results are sorted and unique", "[physics][grid]")
{
    SpatialGrid grid{16.0f};
    for (core::u32 i = 10; i > 0; --i)
    {
        grid.insert(idOf(i), {{0.0f, 0.0f}, {100.0f, 100.0f}});
    }

    const auto found = grid.queryRegion({{0.0f, 0.0f}, {100.0f, 100.0f}});
    REQUIRE(found.size() == 10);
    for (core::usize i = 1; i < found.size(); ++i)
    {
        REQUIRE(found[i - 1] < found[i]);
    }
}

TEST_CASE("SpatialGrid never misses an overlapping box", "[physics][grid][soundness]")
{
    SpatialGrid grid{64.0f};

    std::mt19937                          rng{1234};
    std::uniform_real_distribution<float> coord{-300.0f, 300.0f};
    std::uniform_real_distribution<float> extent{1.0f, 120.0f};

    std::vector<math::AABBf> boxes;
    for (core::u32 i = 0; i < 200; ++i)
    {
        const math::Vec2f min{coord(rng), coord(rng)};
        const math::AABBf box{min, min + math::Vec2f{extent(rng), extent(rng)}};
        boxes.push_back(box);
        grid.insert(idOf(i), box);
    }

    for (core::u32 i = 0; i < boxes.size(); ++i)
    {
        const auto found = grid.queryRegion(boxes[i]);
        for (core::u32 j = 0; j < boxes.size(); ++j)
        {
            const bool reported = std::ranges::binary_search(found, idOf(j));
            REQUIRE(reported == boxes[i].intersects(boxes[j]));
        }
    }
}

} // namespace rift::physics
