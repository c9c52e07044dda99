/**
 * @file TestServerClient.cpp
 * @brief End-to-end tests of Server and Client over the loopback network.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rift/net/Client.hpp"
#include "rift/net/Server.hpp"
#include "rift/net/protocol/Codec.hpp"
#include "rift/net/transport/LoopbackNetwork.hpp"

#include <string_view>
#include <utility>
#include <vector>

namespace rift::net {

using Catch::Matchers::WithinAbs;

namespace {

engine::Config testConfig(core::f32 timeoutMs = core::kClientTimeoutMs)
{
    // A generous budget keeps slow CI machines from reporting overruns.
    auto config = engine::Config::Builder{}.tickBudgetMs(1000.0f).clientTimeoutMs(timeoutMs).build();
    REQUIRE(config.has_value());
    return *config;
}

struct Peer
{
    explicit Peer(transport::LoopbackNetwork& network)
        : link{network.clientEndpoint()}
        , world{testConfig()}
        , client{world, *link}
    {}

    std::unique_ptr<transport::IClientTransport> link;
    engine::World                                world;
    Client                                       client;

    [[nodiscard]] ecs::Transform own()
    {
        const auto* transform = world.registry().getComponent<ecs::Transform>(client.controlledEntity());
        REQUIRE(transform != nullptr);
        return *transform;
    }
};

struct Match
{
    explicit Match(core::f32 timeoutMs = core::kClientTimeoutMs)
        : link{network.serverEndpoint()}
        , world{testConfig(timeoutMs)}
        , server{world, *link}
    {}

    transport::LoopbackNetwork                   network;
    std::unique_ptr<transport::IServerTransport> link;
    engine::World                                world;
    Server                                       server;

    void join(Peer& peer)
    {
        REQUIRE(peer.client.connect().has_value());
        REQUIRE(server.tick().has_value());
        peer.client.poll();
        REQUIRE(peer.client.state() == ClientState::Connected);
        REQUIRE(peer.client.controlledEntity().isValid());
    }

    [[nodiscard]] ecs::EntityId entityOf(core::ClientId client)
    {
        const auto* session = server.sessions().find(client);
        REQUIRE(session != nullptr);
        return session->boundEntity();
    }

    [[nodiscard]] ecs::Transform& transformOf(core::ClientId client)
    {
        auto* transform = world.registry().getComponent<ecs::Transform>(entityOf(client));
        REQUIRE(transform != nullptr);
        return *transform;
    }
};

protocol::InputCommand moveRight(core::Sequence sequence)
{
    return {.sequence = sequence, .tick = 0, .move = {1.0f, 0.0f}, .actionFlags = ecs::kActionNone};
}

protocol::PacketType typeOf(std::span<const core::byte> bytes)
{
    return static_cast<protocol::PacketType>(bytes[5]);
}

/// Server endpoint fed by hand that remembers which peers were released.
class ScriptedTransport final : public transport::IServerTransport
{
public:
    void deliver(core::ClientId client, std::vector<core::byte> bytes)
    {
        _inbox.push_back({client, std::move(bytes)});
    }

    [[nodiscard]] core::Expected<void> sendToClient(core::ClientId, std::span<const core::byte>) override
    {
        return {};
    }

    void broadcast(std::span<const core::byte>) override {}

    [[nodiscard]] std::vector<Datagram> receive() override { return std::exchange(_inbox, {}); }

    void forget(core::ClientId client) override { forgotten.push_back(client); }

    [[nodiscard]] std::string_view name() const noexcept override { return "scripted"; }

    std::vector<core::ClientId> forgotten;

private:
    std::vector<Datagram> _inbox;
};

} // namespace

TEST_CASE("Client joins and mirrors its character", "[net][e2e]")
{
    Match match;
    Peer peer{match.network};
    match.join(peer);

    REQUIRE(peer.client.clientId() == 1);
    REQUIRE(match.server.sessions().activeCount() == 1);
    REQUIRE(peer.client.lastSnapshotTick() == match.world.tick());

    const auto server = match.transformOf(1);
    REQUIRE(peer.own().position == server.position);
    REQUIRE_FALSE(peer.world.registry().hasComponent<ecs::Interpolated>(peer.client.controlledEntity()));

    auto render = peer.client.renderState(peer.client.controlledEntity());
    REQUIRE(render.has_value());
    REQUIRE(render->tag == "idle");
}

TEST_CASE("Prediction agreeing with the server needs no replay", "[net][e2e]")
{
    Match match;
    Peer peer{match.network};
    match.join(peer);

    const core::f32 startX = peer.own().position.x;
    const core::f32 step   = peer.world.config().character().moveSpeed * peer.world.config().fixedDeltaTime();

    REQUIRE(peer.client.tick(moveRight(1)).has_value());
    REQUIRE_THAT(peer.own().position.x, WithinAbs(startX + step, 1e-3f));

    REQUIRE(match.server.tick().has_value());
    REQUIRE_THAT(match.transformOf(1).position.x, WithinAbs(startX + step, 1e-3f));

    peer.client.poll();
    REQUIRE_FALSE(peer.client.lastReconcile().diverged);
    REQUIRE(peer.client.lastReconcile().replayed == 0);
    REQUIRE(peer.client.prediction().find(1) != nullptr);
    REQUIRE_THAT(peer.own().position.x, WithinAbs(startX + step, 1e-3f));
}

TEST_CASE("Disagreement snaps to the server and replays newer inputs", "[net][e2e]")
{
    Match match;
    Peer peer{match.network};
    match.join(peer);

    const core::f32 step = peer.world.config().character().moveSpeed * peer.world.config().fixedDeltaTime();

    for (core::Sequence seq = 1; seq <= 3; ++seq)
    {
        REQUIRE(peer.client.tick(moveRight(seq)).has_value());
    }

    // Something only the server knows about shoves the character.
    match.transformOf(1).position.x += 50.0f;
    REQUIRE(match.server.tick().has_value());
    const core::f32 authoritativeX = match.transformOf(1).position.x;

    const auto localTick = peer.world.tick();
    peer.client.poll();
    const auto& result = peer.client.lastReconcile();
    REQUIRE(result.diverged);
    REQUIRE(result.replayed == 2);
    REQUIRE_THAT(result.positionError, WithinAbs(50.0f, 1e-2f));
    REQUIRE_THAT(peer.own().position.x, WithinAbs(authoritativeX + 2.0f * step, 1e-3f));
    REQUIRE(peer.world.tick() == localTick);
}

TEST_CASE("Remote characters are interpolated", "[net][e2e]")
{
    Match match;
    Peer alice{match.network};
    Peer bob{match.network};

    REQUIRE(alice.client.connect().has_value());
    REQUIRE(bob.client.connect().has_value());
    REQUIRE(match.server.tick().has_value());
    alice.client.poll();
    bob.client.poll();

    const auto bobOnAlice = alice.client.localEntity(match.entityOf(2).raw());
    REQUIRE(bobOnAlice.isValid());
    REQUIRE(alice.world.registry().hasComponent<ecs::Interpolated>(bobOnAlice));

    auto render = alice.client.renderState(bobOnAlice);
    REQUIRE(render.has_value());
    REQUIRE(render->position == match.transformOf(2).position);

    core::usize drawn = 0;
    alice.client.forEachRenderable([&](ecs::EntityId, const RenderTransform&) { ++drawn; });
    REQUIRE(drawn == 2);

    // The remote never runs local gameplay: its position only follows samples.
    const auto before = alice.world.registry().getComponent<ecs::Transform>(bobOnAlice)->position;
    REQUIRE(alice.client.tick(moveRight(1)).has_value());
    REQUIRE(alice.world.registry().getComponent<ecs::Transform>(bobOnAlice)->position == before);
}

TEST_CASE("Each client gets one coalesced snapshot per tick", "[net][e2e]")
{
    Match match;
    Peer alice{match.network};
    Peer bob{match.network};
    match.join(alice);
    match.join(bob);

    std::vector<core::ClientId> snapshots;
    match.network.setDropFilter([&](transport::LoopbackDirection direction, core::ClientId client,
                                    std::span<const core::byte> bytes) {
        if (direction == transport::LoopbackDirection::ToClient && typeOf(bytes) == protocol::PacketType::Snapshot)
        {
            snapshots.push_back(client);
        }
        return false;
    });

    const auto sent = match.server.snapshotsSent();
    REQUIRE(match.server.tick().has_value());
    REQUIRE(snapshots.size() == 2);
    REQUIRE(snapshots[0] != snapshots[1]);
    REQUIRE(match.server.snapshotsSent() == sent + 2);
}

TEST_CASE("Unacknowledged clients keep receiving full snapshots", "[net][e2e]")
{
    Match match;
    Peer peer{match.network};

    std::vector<bool> full;
    match.network.setDropFilter([&](transport::LoopbackDirection direction, core::ClientId,
                                    std::span<const core::byte> bytes) {
        if (direction == transport::LoopbackDirection::ToServer)
        {
            return typeOf(bytes) == protocol::PacketType::SnapshotAck;
        }
        if (typeOf(bytes) == protocol::PacketType::Snapshot)
        {
            full.push_back(protocol::hasFlag(static_cast<core::u8>(bytes[6]), protocol::PacketFlag::FullSnapshot));
        }
        return false;
    });

    match.join(peer);
    for (int i = 0; i < 3; ++i)
    {
        REQUIRE(match.server.tick().has_value());
        peer.client.poll();
    }

    REQUIRE(full.size() == 4);
    for (const bool f : full)
    {
        REQUIRE(f);
    }
}

TEST_CASE("Lost snapshots do not stall replication", "[net][e2e]")
{
    Match match;
    Peer peer{match.network};
    match.join(peer);

    bool dropNext = true;
    match.network.setDropFilter([&](transport::LoopbackDirection direction, core::ClientId,
                                    std::span<const core::byte> bytes) {
        if (direction != transport::LoopbackDirection::ToClient || typeOf(bytes) != protocol::PacketType::Snapshot)
        {
            return false;
        }
        dropNext = !dropNext;
        return !dropNext;
    });

    for (core::Sequence seq = 1; seq <= 6; ++seq)
    {
        REQUIRE(peer.client.tick(moveRight(seq)).has_value());
        REQUIRE(match.server.tick().has_value());
        peer.client.poll();
    }

    REQUIRE(match.network.dropped() == 3);
    REQUIRE(peer.client.lastSnapshotTick() == match.world.tick());
    REQUIRE(peer.client.malformedDropped() == 0);
    REQUIRE_FALSE(peer.client.lastReconcile().diverged);
}

TEST_CASE("Repeated malformed packets disconnect the sender", "[net][e2e]")
{
    Match match;
    Peer peer{match.network};
    match.join(peer);

    const std::vector<core::byte> garbage(8, core::byte{0xEE});
    const auto threshold = match.world.config().malformedThreshold();

    for (core::u32 i = 0; i + 1 < threshold; ++i)
    {
        REQUIRE(peer.link->send(garbage).has_value());
    }
    REQUIRE(match.server.tick().has_value());
    REQUIRE(match.server.sessions().contains(1));

    REQUIRE(peer.link->send(garbage).has_value());
    REQUIRE(match.server.tick().has_value());
    REQUIRE_FALSE(match.server.sessions().contains(1));
    REQUIRE(match.server.malformedDropped() == threshold);
    REQUIRE(match.world.registry().liveCount() == 0);
}

TEST_CASE("Peers without a session are released by the transport", "[net][e2e]")
{
    ScriptedTransport link;
    engine::World     world{testConfig()};
    Server            server{world, link};

    const core::ClientId member   = 1;
    const core::ClientId stranger = 7;

    link.deliver(member, protocol::encodePacket(protocol::PacketType::Connect, 1, {}));
    link.deliver(stranger, std::vector<core::byte>(8, core::byte{0xEE}));
    link.deliver(stranger, protocol::encodePacket(protocol::PacketType::Input, 1, protocol::encodeInput(moveRight(1))));
    link.deliver(stranger, protocol::encodePacket(protocol::PacketType::SnapshotAck, 2,
                                                  protocol::encodeSnapshotAck({.tick = 0})));
    REQUIRE(server.tick().has_value());

    REQUIRE(server.sessions().contains(member));
    REQUIRE_FALSE(server.sessions().contains(stranger));
    REQUIRE(link.forgotten == std::vector<core::ClientId>{stranger});

    SECTION("a repeated handshake keeps the member")
    {
        link.forgotten.clear();
        link.deliver(member, protocol::encodePacket(protocol::PacketType::Connect, 2, {}));
        REQUIRE(server.tick().has_value());
        REQUIRE(link.forgotten.empty());
    }
}

TEST_CASE("Valid traffic resets the malformed streak", "[net][e2e]")
{
    Match match;
    Peer peer{match.network};
    match.join(peer);

    const std::vector<core::byte> garbage(3, core::byte{0});
    const auto threshold = match.world.config().malformedThreshold();
    for (core::u32 round = 0; round < 3; ++round)
    {
        for (core::u32 i = 0; i + 1 < threshold; ++i)
        {
            REQUIRE(peer.link->send(garbage).has_value());
        }
        REQUIRE(peer.client.tick(moveRight(round + 1)).has_value());
        REQUIRE(match.server.tick().has_value());
    }
    REQUIRE(match.server.sessions().contains(1));
}

TEST_CASE("Client disconnect removes its character", "[net][e2e]")
{
    Match match;
    Peer peer{match.network};
    match.join(peer);

    REQUIRE(peer.client.disconnect().has_value());
    REQUIRE(peer.client.state() == ClientState::Disconnected);
    REQUIRE(match.server.tick().has_value());

    REQUIRE(match.server.sessions().activeCount() == 0);
    REQUIRE(match.world.registry().liveCount() == 0);

    auto refused = peer.client.tick(moveRight(1));
    REQUIRE_FALSE(refused.has_value());
    REQUIRE(refused.error().code() == core::ErrorCode::kNotConnected);
}

TEST_CASE("Silent clients time out", "[net][e2e]")
{
    Match match{100.0f};
    Peer peer{match.network};
    match.join(peer);

    const auto timeoutTicks = match.world.config().clientTimeoutTicks();
    for (core::u32 i = 0; i <= timeoutTicks + 1; ++i)
    {
        REQUIRE(match.server.tick().has_value());
    }
    REQUIRE(match.server.sessions().activeCount() == 0);
    REQUIRE(match.world.registry().liveCount() == 0);
}

TEST_CASE("Client rejects inputs it cannot predict", "[net][e2e]")
{
    Match match;
    Peer peer{match.network};

    auto early = peer.client.tick(moveRight(1));
    REQUIRE_FALSE(early.has_value());
    REQUIRE(early.error().code() == core::ErrorCode::kNotConnected);

    match.join(peer);
    REQUIRE(peer.client.tick(moveRight(4)).has_value());

    auto stale = peer.client.tick(moveRight(4));
    REQUIRE_FALSE(stale.has_value());
    REQUIRE(stale.error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(peer.client.prediction().pendingCount() == 1);
}

TEST_CASE("Client counts malformed server packets", "[net][e2e]")
{
    Match match;
    Peer peer{match.network};
    match.join(peer);

    const std::vector<core::byte> garbage(20, core::byte{0x42});
    REQUIRE(match.link->sendToClient(1, garbage).has_value());
    REQUIRE(match.link->sendToClient(1, protocol::encodePacket(protocol::PacketType::Input, 1, {})).has_value());
    peer.client.poll();

    REQUIRE(peer.client.malformedDropped() == 2);
    REQUIRE(peer.client.state() == ClientState::Connected);
}

} // namespace rift::net
