/**
 * @file TestRingBuffer.cpp
 * @brief Unit tests for container::RingBuffer.
 */

#include <catch2/catch_test_macros.hpp>

#include "rift/container/RingBuffer.hpp"

namespace rift::container {

TEST_CASE("RingBuffer basic push and pop", "[container][ringbuffer]")
{
    RingBuffer<int, 8> buffer;

    REQUIRE(buffer.isEmpty());
    REQUIRE(buffer.capacity() == 8);

    REQUIRE_FALSE(buffer.push(42));
    REQUIRE(buffer.size() == 1);

    int val = 0;
    REQUIRE(buffer.pop(val));
    REQUIRE(val == 42);
    REQUIRE(buffer.isEmpty());
    REQUIRE_FALSE(buffer.pop(val));
}

TEST_CASE("RingBuffer overwrites the oldest element when full", "[container][ringbuffer]")
{
    RingBuffer<int, 4> buffer;

    for (int i = 0; i < 4; ++i)
        REQUIRE_FALSE(buffer.push(i));

    REQUIRE(buffer.isFull());
    REQUIRE(buffer.push(4));
    REQUIRE(buffer.size() == 4);
    REQUIRE(buffer.front() == 1);
    REQUIRE(buffer.back() == 4);

    for (int i = 0; i < 4; ++i)
        REQUIRE(buffer[static_cast<core::usize>(i)] == i + 1);
}

TEST_CASE("RingBuffer partial removals keep logical order", "[container][ringbuffer]")
{
    RingBuffer<int, 8> buffer;
    for (int i = 0; i < 6; ++i)
        buffer.push(i);

    SECTION("dropFront")
    {
        buffer.dropFront(2);
        REQUIRE(buffer.size() == 4);
        REQUIRE(buffer.front() == 2);

        buffer.dropFront(100);
        REQUIRE(buffer.isEmpty());
    }

    SECTION("eraseAt")
    {
        buffer.eraseAt(1);
        REQUIRE(buffer.size() == 5);
        REQUIRE(buffer[0] == 0);
        REQUIRE(buffer[1] == 2);
        REQUIRE(buffer.back() == 5);
    }

    SECTION("truncate")
    {
        buffer.truncate(3);
        REQUIRE(buffer.size() == 3);
        REQUIRE(buffer.back() == 2);
    }
}

TEST_CASE("RingBuffer wraps around", "[container][ringbuffer]")
{
    RingBuffer<int, 4> buffer;
    int out = 0;
    for (int round = 0; round < 10; ++round)
    {
        buffer.push(round);
        buffer.push(round + 100);
        REQUIRE(buffer.pop(out));
        REQUIRE(out == round);
        REQUIRE(buffer.pop(out));
        REQUIRE(out == round + 100);
    }
    REQUIRE(buffer.isEmpty());
}

} // namespace rift::container
