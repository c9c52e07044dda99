/**
 * @file Server.cpp
 * @brief Server implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/Server.hpp>
#include <rift/net/protocol/Codec.hpp>
#include <rift/net/replication/Snapshot.hpp>
#include <rift/core/Log.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace rift::net {

using protocol::PacketType;

struct Server::Impl
{
    engine::World&                world;
    transport::IServerTransport&  transport;
    session::SessionManager       sessions;
    replication::SnapshotHistory  history;
    core::u32                     outgoingSequence{0};
    core::u64                     malformed{0};
    core::u64                     snapshotsSent{0};

    Impl(engine::World& w, transport::IServerTransport& t)
        : world{w}
        , transport{t}
        , sessions{w.config().maxSessions()}
        , history{w.config().snapshotHistory()}
    {}

    // ---------------------------------------------------------------------- //
    //  Outbound                                                              //
    // ---------------------------------------------------------------------- //

    void send(core::ClientId client, PacketType type, std::span<const core::byte> payload, core::u8 flags = 0)
    {
        const auto bytes = protocol::encodePacket(type, ++outgoingSequence, payload, flags);
        if (auto sent = transport.sendToClient(client, bytes); !sent)
        {
            core::Log::warn("NET", "send " + std::string{protocol::toString(type)} + " to client " +
                                       std::to_string(client) + " failed: " + sent.error().message());
        }
    }

    void sendAccepted(const session::Session& session)
    {
        const protocol::ConnectAccepted accepted{
            .clientId   = session.clientId(),
            .entityId   = session.boundEntity().raw(),
            .serverTick = world.tick(),
            .tickRate   = static_cast<core::u16>(world.config().tickRate()),
        };
        send(session.clientId(), PacketType::ConnectAccepted, protocol::encodeConnectAccepted(accepted));
    }

    // ---------------------------------------------------------------------- //
    //  Session lifecycle                                                     //
    // ---------------------------------------------------------------------- //

    [[nodiscard]] math::Vec2f spawnPoint(core::ClientId client) const
    {
        const auto& bounds = world.config().worldBounds();
        const core::f32 width = bounds.max.x - bounds.min.x;
        const core::f32 slot  = static_cast<core::f32>(client % 8) + 0.5f;
        return {bounds.min.x + width * slot / 8.0f, bounds.min.y + engine::kCharacterSize.y * 0.5f};
    }

    void accept(core::ClientId client)
    {
        if (auto* existing = sessions.find(client))
        {
            // Lost handshake: answer again without spawning twice.
            existing->touch(world.tick());
            sendAccepted(*existing);
            return;
        }

        auto session = sessions.connect(client, world.tick());
        if (!session)
        {
            core::Log::warn("NET", "refusing client " + std::to_string(client) + ": " +
                                       session.error().message());
            return;
        }

        auto entity = world.spawnCharacter(spawnPoint(client), client);
        if (!entity)
        {
            core::Log::error("NET", "cannot spawn character for client " + std::to_string(client) +
                                        ": " + entity.error().message());
            drop(client);
            return;
        }
        (*session)->bindEntity(*entity);
        sendAccepted(**session);
    }

    void drop(core::ClientId client)
    {
        const auto destroyed = world.destroyOwnedBy(client);
        transport.forget(client);
        if (auto removed = sessions.disconnect(client); !removed)
        {
            core::Log::debug("NET", removed.error().message());
            return;
        }
        core::Log::info("NET", "client " + std::to_string(client) + " removed with " +
                                   std::to_string(destroyed) + " entities");
    }

    void onMalformed(core::ClientId client, const core::Error& error)
    {
        ++malformed;
        auto* session = sessions.find(client);
        if (!session)
        {
            core::Log::warn("NET", "dropped malformed packet from unknown peer " + std::to_string(client) +
                                       ": " + error.message());
            return;
        }

        const auto count = session->recordMalformed();
        core::Log::warn("NET", "dropped malformed packet from client " + std::to_string(client) + " (" +
                                   std::to_string(count) + " in a row): " + error.message());
        if (count >= world.config().malformedThreshold())
        {
            core::Log::warn("NET", "disconnecting client " + std::to_string(client) +
                                       " after too many malformed packets");
            drop(client);
        }
    }

    // ---------------------------------------------------------------------- //
    //  Inbound                                                               //
    // ---------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<void> dispatch(core::ClientId client, const protocol::Packet& packet)
    {
        auto* session = sessions.find(client);

        switch (packet.header.type)
        {
            case PacketType::Connect:
                RIFT_TRY_VOID(protocol::expectEmpty(packet.payload));
                accept(client);
                return {};

            case PacketType::Disconnect:
                RIFT_TRY_VOID(protocol::expectEmpty(packet.payload));
                if (session)
                {
                    drop(client);
                }
                return {};

            case PacketType::Input:
            {
                const auto command = RIFT_TRY(protocol::decodeInput(packet.payload));
                if (!session)
                {
                    return {};
                }
                if (!session->pushInput(command))
                {
                    core::Log::debug("NET", "client " + std::to_string(client) + " input " +
                                                std::to_string(command.sequence) + " dropped (stale or duplicate)");
                }
                session->touch(world.tick());
                return {};
            }

            case PacketType::SnapshotAck:
            {
                const auto ack = RIFT_TRY(protocol::decodeSnapshotAck(packet.payload));
                if (!session)
                {
                    return {};
                }
                if (ack.tick > world.tick())
                {
                    return core::makeError(core::ErrorCode::kMalformedPacket,
                                           "ack for future tick " + std::to_string(ack.tick));
                }
                session->acknowledgeSnapshot(ack.tick);
                session->touch(world.tick());
                return {};
            }

            case PacketType::ConnectAccepted:
            case PacketType::Snapshot:
                break;
        }
        return core::makeError(core::ErrorCode::kMalformedPacket,
                               std::string{protocol::toString(packet.header.type)} + " is server-to-client only");
    }

    void receive()
    {
        std::vector<core::ClientId> peers;
        for (const auto& datagram : transport.receive())
        {
            peers.push_back(datagram.clientId);
            auto packet = protocol::decodePacket(datagram.bytes);
            if (!packet)
            {
                onMalformed(datagram.clientId, packet.error());
                continue;
            }
            if (auto handled = dispatch(datagram.clientId, *packet); !handled)
            {
                onMalformed(datagram.clientId, handled.error());
            }
        }

        // Stray peers that never got a session must not pin a transport id.
        std::ranges::sort(peers);
        const auto [first, last] = std::ranges::unique(peers);
        peers.erase(first, last);
        for (const auto client : peers)
        {
            if (!sessions.contains(client))
            {
                transport.forget(client);
            }
        }
    }

    void reap()
    {
        sessions.reapTimedOut(world.tick(), world.config().clientTimeoutTicks(), [this](session::Session& s) {
            const auto destroyed = world.destroyOwnedBy(s.clientId());
            transport.forget(s.clientId());
            core::Log::info("NET", "destroyed " + std::to_string(destroyed) + " entities of client " +
                                       std::to_string(s.clientId()));
        });
    }

    // ---------------------------------------------------------------------- //
    //  Simulation                                                            //
    // ---------------------------------------------------------------------- //

    void applyInputs()
    {
        auto& registry = world.registry();
        sessions.forEach([&](session::Session& s) {
            const auto command = s.nextInput();
            auto* input = registry.getComponent<ecs::PlayerInput>(s.boundEntity());
            if (!input)
            {
                return;
            }
            input->sequence    = command.sequence;
            input->tick        = command.tick;
            input->move        = {std::clamp(command.move.x, -1.0f, 1.0f), std::clamp(command.move.y, -1.0f, 1.0f)};
            input->actionFlags = command.actionFlags;
        });
    }

    void replicate()
    {
        const core::Tick now = world.tick();
        history.record(replication::captureSnapshot(world.registry(), now));
        const auto& current = *history.latest();
        const core::u32 fullInterval = world.config().fullSnapshotInterval();

        sessions.forEach([&](session::Session& s) {
            const replication::Snapshot* baseline = nullptr;
            const auto lastFull = s.lastFullSnapshot();
            if (s.ackedTick() != 0 && lastFull && now - *lastFull < fullInterval)
            {
                baseline = history.find(s.ackedTick());
            }

            const auto delta = replication::makeDelta(current, baseline, s.lastAppliedSequence());
            const auto payload = protocol::encodeSnapshotDelta(delta);
            if (!payload)
            {
                core::Log::error("NET", "snapshot for client " + std::to_string(s.clientId()) +
                                            " not sent: " + payload.error().message());
                return;
            }
            const auto flags = delta.isFull() ? static_cast<core::u8>(protocol::PacketFlag::FullSnapshot) : core::u8{0};
            send(s.clientId(), PacketType::Snapshot, *payload, flags);
            ++snapshotsSent;

            if (delta.isFull())
            {
                s.markFullSnapshot(now);
            }
        });
    }
};

Server::Server(engine::World& world, transport::IServerTransport& transport)
    : _impl{std::make_unique<Impl>(world, transport)}
{
    core::Log::info("NET", "server running at " + std::to_string(world.config().tickRate()) +
                               " Hz over " + std::string{transport.name()});
}

Server::~Server() = default;

core::Expected<void> Server::tick()
{
    const core::Log::TickScope stamp{_impl->world.tick() + 1};
    _impl->receive();
    _impl->reap();
    _impl->applyInputs();
    auto stepped = _impl->world.step();
    _impl->replicate();
    return stepped;
}

engine::World& Server::world() noexcept { return _impl->world; }

session::SessionManager&       Server::sessions() noexcept       { return _impl->sessions; }
const session::SessionManager& Server::sessions() const noexcept { return _impl->sessions; }

const replication::SnapshotHistory& Server::history() const noexcept { return _impl->history; }

core::u64 Server::malformedDropped() const noexcept { return _impl->malformed; }
core::u64 Server::snapshotsSent() const noexcept    { return _impl->snapshotsSent; }

} // namespace rift::net
