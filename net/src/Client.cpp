/**
 * @file Client.cpp
 * @brief Client implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/Client.hpp>
#include <rift/net/netcode/Interpolator.hpp>
#include <rift/net/protocol/Codec.hpp>
#include <rift/net/replication/Snapshot.hpp>
#include <rift/net/replication/SnapshotHistory.hpp>
#include <rift/gameplay/ActionState.hpp>
#include <rift/core/Log.hpp>

#include <algorithm>
#include <string>
#include <unordered_map>

namespace rift::net {

using protocol::PacketType;

namespace {

/// Polls between two Connect attempts while the handshake is pending.
constexpr core::u32 kConnectRetryPolls = 30;

} // namespace

struct Client::Impl
{
    engine::World&                 world;
    transport::IClientTransport&   transport;
    ClientState                    state{ClientState::Disconnected};
    core::ClientId                 clientId{core::kNoClient};
    core::u32                      serverEntity{ecs::EntityId::kNull};
    ecs::EntityId                  controlled{};
    core::u32                      outgoingSequence{0};
    core::Sequence                 lastSequence{0};
    core::Tick                     lastSnapshot{0};
    core::f64                      serverTime{0.0};
    core::u32                      pollsSinceConnect{0};
    core::u64                      malformed{0};

    replication::SnapshotHistory   baselines;
    netcode::Prediction            prediction;
    netcode::Reconciliation        reconciliation;
    netcode::Interpolator          interpolator;
    netcode::ReconcileResult       lastReconcile{};

    std::unordered_map<core::u32, ecs::EntityId> toLocal;
    std::unordered_map<ecs::EntityId, core::u32> toServer;

    Impl(engine::World& w, transport::IClientTransport& t)
        : world{w}
        , transport{t}
        , baselines{w.config().snapshotHistory()}
        , prediction{w.config().predictionHistory()}
        , reconciliation{prediction, w.config().reconciliationEpsilon()}
        , interpolator{w.config().interpolationDelaySeconds()}
    {}

    [[nodiscard]] core::f64 dt() const { return static_cast<core::f64>(world.config().fixedDeltaTime()); }

    [[nodiscard]] core::Expected<void> send(PacketType type, std::span<const core::byte> payload)
    {
        const auto bytes = protocol::encodePacket(type, ++outgoingSequence, payload);
        return transport.send(bytes);
    }

    void reset()
    {
        for (const auto& [serverId, local] : toLocal)
        {
            world.registry().destroyEntity(local);
        }
        toLocal.clear();
        toServer.clear();
        controlled = {};
        serverEntity = ecs::EntityId::kNull;
        clientId = core::kNoClient;
        lastSequence = 0;
        lastSnapshot = 0;
        baselines.clear();
        prediction.clear();
        interpolator.clear();
        lastReconcile = {};
    }

    // ---------------------------------------------------------------------- //
    //  Controlled entity                                                     //
    // ---------------------------------------------------------------------- //

    [[nodiscard]] netcode::PredictedState capture() const
    {
        netcode::PredictedState result;
        const auto& registry = world.registry();
        if (const auto* t = registry.getComponent<ecs::Transform>(controlled))
            result.transform = *t;
        if (const auto* b = registry.getComponent<ecs::Body>(controlled))
            result.body = *b;
        if (const auto* c = registry.getComponent<ecs::Character>(controlled))
            result.character = *c;
        return result;
    }

    void applyState(const netcode::PredictedState& state)
    {
        auto& registry = world.registry();
        if (auto* t = registry.getComponent<ecs::Transform>(controlled))
            *t = state.transform;
        if (auto* b = registry.getComponent<ecs::Body>(controlled))
            *b = state.body;
        if (auto* c = registry.getComponent<ecs::Character>(controlled))
            *c = state.character;
    }

    void setInput(const protocol::InputCommand& command)
    {
        if (auto* input = world.registry().getComponent<ecs::PlayerInput>(controlled))
        {
            input->sequence    = command.sequence;
            input->tick        = command.tick;
            input->move        = {std::clamp(command.move.x, -1.0f, 1.0f), std::clamp(command.move.y, -1.0f, 1.0f)};
            input->actionFlags = command.actionFlags;
        }
    }

    netcode::PredictedState resimulate(const protocol::InputCommand& command)
    {
        setInput(command);
        if (auto stepped = world.step(); !stepped && stepped.error().code() != core::ErrorCode::kTickOverrun)
        {
            core::Log::error("NET", "replay of input " + std::to_string(command.sequence) +
                                        " failed: " + stepped.error().message());
        }
        return capture();
    }

    void reconcile(const protocol::EntityState& own, core::Sequence ackedInput)
    {
        if (!own.has(protocol::kFieldTransform) || !own.has(protocol::kFieldBody) ||
            !own.has(protocol::kFieldCharacter))
        {
            return;
        }

        netcode::PredictedState authoritative{.transform = own.transform, .body = own.body};
        authoritative.character = capture().character;
        replication::applyCharacterState(authoritative.character, own.character);

        // Replays must not re-announce collisions nor move the local clock.
        auto& collisions = world.collisions();
        const bool muted = collisions.eventsMuted();
        const core::Tick now = world.tick();
        collisions.setEventsMuted(true);

        lastReconcile = reconciliation.reconcile(
            authoritative, ackedInput,
            [this](const netcode::PredictedState& state) { applyState(state); },
            [this](const protocol::InputCommand& command) { return resimulate(command); });

        world.setTick(now);
        collisions.setEventsMuted(muted);
    }

    // ---------------------------------------------------------------------- //
    //  Mirrored world                                                        //
    // ---------------------------------------------------------------------- //

    template <ecs::Component T>
    void sync(ecs::EntityId local, bool present, const T& value)
    {
        auto& registry = world.registry();
        auto result = present ? registry.addComponent<T>(local, value) : registry.removeComponent<T>(local);
        if (!result)
        {
            core::Log::warn("NET", "cannot mirror component on entity " + ecs::toString(local) + ": " +
                                       result.error().message());
        }
    }

    [[nodiscard]] core::Expected<ecs::EntityId> mirror(const protocol::EntityState& entry)
    {
        auto& registry = world.registry();
        const bool own = entry.entityId == serverEntity;

        ecs::EntityId local{};
        bool created = false;
        if (auto it = toLocal.find(entry.entityId); it != toLocal.end())
        {
            local = it->second;
        }
        else
        {
            local = RIFT_TRY(registry.createEntity());
            toLocal.emplace(entry.entityId, local);
            toServer.emplace(local, entry.entityId);
            created = true;
            if (own)
            {
                RIFT_TRY_VOID(registry.addComponent<ecs::PlayerInput>(local));
                controlled = local;
                core::Log::info("NET", "controlling entity " + std::to_string(entry.entityId));
            }
            else
            {
                RIFT_TRY_VOID(registry.addComponent<ecs::Interpolated>(local));
            }
        }

        sync(local, entry.has(protocol::kFieldHitbox), entry.hitbox);
        sync(local, entry.has(protocol::kFieldOwner), entry.owner);

        // The predicted state of the own entity is only touched by
        // reconciliation once it exists.
        if (!own || created)
        {
            sync(local, entry.has(protocol::kFieldTransform), entry.transform);
            sync(local, entry.has(protocol::kFieldBody), entry.body);
            if (entry.has(protocol::kFieldCharacter))
            {
                ecs::Character character = world.characters().spawn();
                if (const auto* existing = registry.getComponent<ecs::Character>(local))
                    character = *existing;
                replication::applyCharacterState(character, entry.character);
                sync(local, true, character);
            }
            else
            {
                sync(local, false, ecs::Character{});
            }
        }
        return local;
    }

    void forget(core::u32 serverId)
    {
        auto it = toLocal.find(serverId);
        if (it == toLocal.end())
            return;
        if (it->second == controlled)
        {
            controlled = {};
            prediction.clear();
        }
        world.registry().destroyEntity(it->second);
        toServer.erase(it->second);
        toLocal.erase(it);
        interpolator.remove(serverId);
    }

    void refreshRemotes()
    {
        auto& registry = world.registry();
        for (const auto& [serverId, local] : toLocal)
        {
            if (local == controlled)
                continue;
            if (auto shown = interpolator.sample(serverId, serverTime))
            {
                if (auto* t = registry.getComponent<ecs::Transform>(local))
                    *t = *shown;
            }
        }
    }

    // ---------------------------------------------------------------------- //
    //  Inbound                                                               //
    // ---------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<void> onAccepted(const protocol::ConnectAccepted& accepted)
    {
        if (state == ClientState::Connected)
        {
            return {};
        }
        if (accepted.tickRate != world.config().tickRate())
        {
            core::Log::warn("NET", "server runs at " + std::to_string(accepted.tickRate) + " Hz, local world at " +
                                       std::to_string(world.config().tickRate()) + " Hz");
        }
        clientId     = accepted.clientId;
        serverEntity = accepted.entityId;
        state        = ClientState::Connected;
        world.setTick(accepted.serverTick);
        serverTime = static_cast<core::f64>(accepted.serverTick) * dt();
        core::Log::info("NET", "connected as client " + std::to_string(clientId) + " at server tick " +
                                   std::to_string(accepted.serverTick));
        return {};
    }

    [[nodiscard]] core::Expected<void> onSnapshot(const protocol::SnapshotDelta& delta)
    {
        if (state != ClientState::Connected || delta.tick <= lastSnapshot)
        {
            return {};
        }

        const replication::Snapshot* baseline = delta.isFull() ? nullptr : baselines.find(delta.baseTick);
        auto snapshot = RIFT_TRY(replication::applyDelta(delta, baseline));

        lastSnapshot = snapshot.tick;
        serverTime = std::max(serverTime, static_cast<core::f64>(snapshot.tick) * dt());
        RIFT_TRY_VOID(send(PacketType::SnapshotAck, protocol::encodeSnapshotAck({.tick = snapshot.tick})));

        const core::f64 sampleTime = static_cast<core::f64>(snapshot.tick) * dt();
        const protocol::EntityState* own = nullptr;
        for (const auto& entry : snapshot.entities)
        {
            if (auto mirrored = mirror(entry); !mirrored)
            {
                core::Log::error("NET", "cannot mirror entity " + std::to_string(entry.entityId) + ": " +
                                            mirrored.error().message());
                continue;
            }
            if (entry.entityId == serverEntity)
                own = &entry;
            else if (entry.has(protocol::kFieldTransform))
                interpolator.push(entry.entityId, sampleTime, entry.transform);
        }

        std::vector<core::u32> gone;
        for (const auto& [serverId, local] : toLocal)
        {
            if (!snapshot.find(serverId))
                gone.push_back(serverId);
        }
        for (const auto serverId : gone)
        {
            forget(serverId);
        }

        if (own && controlled.isValid())
        {
            reconcile(*own, delta.ackedInput);
        }

        baselines.record(std::move(snapshot));
        return {};
    }

    [[nodiscard]] core::Expected<void> dispatch(const protocol::Packet& packet)
    {
        switch (packet.header.type)
        {
            case PacketType::ConnectAccepted:
                return onAccepted(RIFT_TRY(protocol::decodeConnectAccepted(packet.payload)));

            case PacketType::Snapshot:
            {
                const auto delta = RIFT_TRY(protocol::decodeSnapshotDelta(packet.payload));
                const bool flagged = protocol::hasFlag(packet.header.flags, protocol::PacketFlag::FullSnapshot);
                if (flagged != delta.isFull())
                {
                    return core::makeError(core::ErrorCode::kMalformedPacket,
                                           "Snapshot full flag disagrees with its baseline");
                }
                return onSnapshot(delta);
            }

            case PacketType::Disconnect:
                RIFT_TRY_VOID(protocol::expectEmpty(packet.payload));
                core::Log::info("NET", "server closed the session");
                reset();
                state = ClientState::Disconnected;
                return {};

            case PacketType::Connect:
            case PacketType::Input:
            case PacketType::SnapshotAck:
                break;
        }
        return core::makeError(core::ErrorCode::kMalformedPacket,
                               std::string{protocol::toString(packet.header.type)} + " is client-to-server only");
    }
};

Client::Client(engine::World& world, transport::IClientTransport& transport)
    : _impl{std::make_unique<Impl>(world, transport)}
{}

Client::~Client() = default;

core::Expected<void> Client::connect()
{
    if (_impl->state != ClientState::Disconnected)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Client already connecting or connected");
    }
    RIFT_TRY_VOID(_impl->send(PacketType::Connect, {}));
    _impl->state = ClientState::Connecting;
    _impl->pollsSinceConnect = 0;
    core::Log::info("NET", "connecting over " + std::string{_impl->transport.name()});
    return {};
}

core::Expected<void> Client::disconnect()
{
    if (_impl->state == ClientState::Disconnected)
    {
        return core::makeError(core::ErrorCode::kNotConnected, "Client is not connected");
    }
    auto sent = _impl->send(PacketType::Disconnect, {});
    _impl->reset();
    _impl->state = ClientState::Disconnected;
    return sent;
}

core::Expected<void> Client::tick(const protocol::InputCommand& command)
{
    auto& impl = *_impl;
    if (impl.state != ClientState::Connected || !impl.world.registry().isAlive(impl.controlled))
    {
        return core::makeError(core::ErrorCode::kNotConnected, "No controlled entity yet");
    }
    if (command.sequence <= impl.lastSequence)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "Input sequence " + std::to_string(command.sequence) + " is not increasing");
    }

    protocol::InputCommand stamped = command;
    stamped.tick = impl.world.tick();
    impl.lastSequence = stamped.sequence;

    impl.refreshRemotes();
    impl.setInput(stamped);
    auto stepped = impl.world.step();
    impl.serverTime += impl.dt();

    impl.prediction.push({.sequence = stamped.sequence, .command = stamped, .result = impl.capture()});
    RIFT_TRY_VOID(impl.send(PacketType::Input, protocol::encodeInput(stamped)));
    return stepped;
}

void Client::poll()
{
    auto& impl = *_impl;
    if (impl.state == ClientState::Connecting && ++impl.pollsSinceConnect >= kConnectRetryPolls)
    {
        impl.pollsSinceConnect = 0;
        if (auto sent = impl.send(PacketType::Connect, {}); !sent)
        {
            core::Log::warn("NET", "connect retry failed: " + sent.error().message());
        }
    }

    for (const auto& bytes : impl.transport.receive())
    {
        auto handled = protocol::decodePacket(bytes).and_then(
            [&impl](const protocol::Packet& packet) { return impl.dispatch(packet); });
        if (handled)
        {
            continue;
        }
        if (handled.error().code() == core::ErrorCode::kMalformedPacket)
        {
            ++impl.malformed;
            core::Log::warn("NET", "dropped malformed packet: " + handled.error().message());
        }
        else
        {
            core::Log::debug("NET", "snapshot ignored: " + handled.error().message());
        }
    }
}

std::optional<RenderTransform> Client::renderState(ecs::EntityId entity) const
{
    const auto& impl = *_impl;
    const auto& registry = impl.world.registry();
    auto server = impl.toServer.find(entity);
    if (server == impl.toServer.end() || !registry.isAlive(entity))
    {
        return std::nullopt;
    }

    std::optional<ecs::Transform> shown;
    if (entity == impl.controlled)
    {
        if (const auto* t = registry.getComponent<ecs::Transform>(entity))
            shown = *t;
    }
    else
    {
        shown = impl.interpolator.sample(server->second, impl.serverTime);
    }
    if (!shown)
    {
        return std::nullopt;
    }

    const auto* character = registry.getComponent<ecs::Character>(entity);
    return RenderTransform{
        .position = shown->position,
        .rotation = shown->rotation,
        .scale    = shown->scale,
        .tag      = character ? gameplay::toTag(character->state) : std::string_view{"prop"},
    };
}

void Client::forEachRenderable(const std::function<void(ecs::EntityId, const RenderTransform&)>& fn) const
{
    for (const auto& [local, serverId] : _impl->toServer)
    {
        if (auto render = renderState(local))
            fn(local, *render);
    }
}

ClientState    Client::state() const noexcept            { return _impl->state; }
core::ClientId Client::clientId() const noexcept         { return _impl->clientId; }
ecs::EntityId  Client::controlledEntity() const noexcept { return _impl->controlled; }

ecs::EntityId Client::localEntity(core::u32 serverId) const noexcept
{
    auto it = _impl->toLocal.find(serverId);
    return it == _impl->toLocal.end() ? ecs::EntityId{} : it->second;
}

core::Tick Client::lastSnapshotTick() const noexcept { return _impl->lastSnapshot; }
core::f64  Client::serverTime() const noexcept       { return _impl->serverTime; }

const netcode::Prediction&      Client::prediction() const noexcept    { return _impl->prediction; }
const netcode::ReconcileResult& Client::lastReconcile() const noexcept { return _impl->lastReconcile; }

core::u64 Client::malformedDropped() const noexcept { return _impl->malformed; }

engine::World& Client::world() noexcept { return _impl->world; }

} // namespace rift::net
