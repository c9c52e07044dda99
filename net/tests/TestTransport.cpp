/**
 * @file TestTransport.cpp
 * @brief Unit tests for PacketQueue and the in-process loopback network.
 */

#include <catch2/catch_test_macros.hpp>

#include "rift/net/PacketQueue.hpp"
#include "rift/net/transport/LoopbackNetwork.hpp"

namespace rift::net::transport {

namespace {

std::vector<core::byte> bytes(std::initializer_list<int> values)
{
    std::vector<core::byte> out;
    for (const int v : values)
    {
        out.push_back(static_cast<core::byte>(v));
    }
    return out;
}

} // namespace

TEST_CASE("PacketQueue is first in first out", "[net][queue]")
{
    PacketQueue queue;
    REQUIRE(queue.empty());

    queue.push({1, bytes({1})});
    queue.push({2, bytes({2})});
    REQUIRE(queue.size() == 2);

    Datagram out;
    REQUIRE(queue.pop(out));
    REQUIRE(out.clientId == 1);

    const auto rest = queue.drain();
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].clientId == 2);
    REQUIRE_FALSE(queue.pop(out));
}

TEST_CASE("Loopback delivers immediately without latency", "[net][loopback]")
{
    LoopbackNetwork network;
    auto server = network.serverEndpoint();
    auto first  = network.clientEndpoint();
    auto second = network.clientEndpoint();

    REQUIRE(first->send(bytes({7})).has_value());
    const auto received = server->receive();
    REQUIRE(received.size() == 1);
    REQUIRE(received[0].clientId == 1);

    REQUIRE(server->sendToClient(2, bytes({9})).has_value());
    REQUIRE(first->receive().empty());
    REQUIRE(second->receive().size() == 1);

    server->broadcast(bytes({3}));
    REQUIRE(first->receive().size() == 1);
    REQUIRE(second->receive().size() == 1);
}

TEST_CASE("Loopback holds packets for the configured latency", "[net][loopback]")
{
    LoopbackNetwork network{2};
    auto server = network.serverEndpoint();
    auto client = network.clientEndpoint();

    REQUIRE(client->send(bytes({1})).has_value());
    REQUIRE(network.inFlight() == 1);

    network.advance();
    REQUIRE(server->receive().empty());
    network.advance();
    REQUIRE(server->receive().size() == 1);
    REQUIRE(network.inFlight() == 0);
}

TEST_CASE("Loopback drop filter discards matching packets", "[net][loopback]")
{
    LoopbackNetwork network;
    auto server = network.serverEndpoint();
    auto client = network.clientEndpoint();

    network.setDropFilter([](LoopbackDirection direction, core::ClientId, std::span<const core::byte>) {
        return direction == LoopbackDirection::ToClient;
    });

    REQUIRE(client->send(bytes({1})).has_value());
    REQUIRE(server->sendToClient(1, bytes({2})).has_value());

    REQUIRE(server->receive().size() == 1);
    REQUIRE(client->receive().empty());
    REQUIRE(network.dropped() == 1);
}

TEST_CASE("Loopback refuses unknown clients", "[net][loopback]")
{
    LoopbackNetwork network;
    auto server = network.serverEndpoint();
    {
        auto client = network.clientEndpoint();
    }

    auto sent = server->sendToClient(1, bytes({1}));
    REQUIRE_FALSE(sent.has_value());
    REQUIRE(sent.error().code() == core::ErrorCode::kNotConnected);
}

} // namespace rift::net::transport
