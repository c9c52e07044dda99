/**
 * @file LoopbackNetwork.cpp
 * @brief LoopbackNetwork implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/transport/LoopbackNetwork.hpp>

#include <deque>
#include <map>
#include <string>

namespace rift::net::transport {

struct LoopbackState
{
    struct InFlight
    {
        core::u64         dueTick;
        LoopbackDirection direction;
        Datagram          datagram;
    };

    core::u32                                            latency{0};
    core::u64                                            now{0};
    core::u64                                            dropped{0};
    core::ClientId                                       nextClient{1};
    LoopbackNetwork::DropFilter                          dropFilter;
    std::deque<InFlight>                                 inFlight;
    PacketQueue                                          serverInbox;
    std::map<core::ClientId, std::shared_ptr<PacketQueue>> clientInboxes;

    void deliver(LoopbackDirection direction, Datagram datagram)
    {
        if (direction == LoopbackDirection::ToServer)
        {
            serverInbox.push(std::move(datagram));
            return;
        }
        const auto it = clientInboxes.find(datagram.clientId);
        if (it != clientInboxes.end())
        {
            it->second->push(std::move(datagram));
        }
    }

    void send(LoopbackDirection direction, core::ClientId client, std::span<const core::byte> bytes)
    {
        if (dropFilter && dropFilter(direction, client, bytes))
        {
            ++dropped;
            return;
        }
        Datagram datagram{client, {bytes.begin(), bytes.end()}};
        if (latency == 0)
        {
            deliver(direction, std::move(datagram));
            return;
        }
        inFlight.push_back({now + latency, direction, std::move(datagram)});
    }
};

namespace {

class LoopbackServerTransport final : public IServerTransport
{
public:
    explicit LoopbackServerTransport(std::shared_ptr<LoopbackState> network)
        : _network{std::move(network)}
    {}

    core::Expected<void> sendToClient(core::ClientId client, std::span<const core::byte> bytes) override
    {
        if (!_network->clientInboxes.contains(client))
        {
            return core::makeError(core::ErrorCode::kNotConnected,
                                   "No loopback client " + std::to_string(client));
        }
        _network->send(LoopbackDirection::ToClient, client, bytes);
        return {};
    }

    void broadcast(std::span<const core::byte> bytes) override
    {
        for (const auto& [client, inbox] : _network->clientInboxes)
        {
            _network->send(LoopbackDirection::ToClient, client, bytes);
        }
    }

    std::vector<Datagram> receive() override { return _network->serverInbox.drain(); }

    void forget(core::ClientId) override {}

    std::string_view name() const noexcept override { return "LoopbackServerTransport"; }

private:
    std::shared_ptr<LoopbackState> _network;
};

class LoopbackClientTransport final : public IClientTransport
{
public:
    LoopbackClientTransport(std::shared_ptr<LoopbackState> network, core::ClientId id,
                            std::shared_ptr<PacketQueue> inbox)
        : _network{std::move(network)}
        , _id{id}
        , _inbox{std::move(inbox)}
    {}

    ~LoopbackClientTransport() override { _network->clientInboxes.erase(_id); }

    core::Expected<void> send(std::span<const core::byte> bytes) override
    {
        _network->send(LoopbackDirection::ToServer, _id, bytes);
        return {};
    }

    std::vector<std::vector<core::byte>> receive() override
    {
        std::vector<std::vector<core::byte>> out;
        for (auto& datagram : _inbox->drain())
        {
            out.push_back(std::move(datagram.bytes));
        }
        return out;
    }

    std::string_view name() const noexcept override { return "LoopbackClientTransport"; }

private:
    std::shared_ptr<LoopbackState> _network;
    core::ClientId                         _id;
    std::shared_ptr<PacketQueue>           _inbox;
};

} // namespace

LoopbackNetwork::LoopbackNetwork(core::u32 latencyTicks)
    : _state{std::make_shared<LoopbackState>()}
{
    _state->latency = latencyTicks;
}

LoopbackNetwork::~LoopbackNetwork() = default;

std::unique_ptr<IServerTransport> LoopbackNetwork::serverEndpoint()
{
    return std::make_unique<LoopbackServerTransport>(_state);
}

std::unique_ptr<IClientTransport> LoopbackNetwork::clientEndpoint()
{
    const core::ClientId id = _state->nextClient++;
    auto inbox = std::make_shared<PacketQueue>();
    _state->clientInboxes.emplace(id, inbox);
    return std::make_unique<LoopbackClientTransport>(_state, id, std::move(inbox));
}

void LoopbackNetwork::advance()
{
    ++_state->now;

    // Latency may have changed while packets were in flight: scan them all.
    std::deque<LoopbackState::InFlight> pending;
    for (auto& packet : _state->inFlight)
    {
        if (packet.dueTick <= _state->now)
        {
            _state->deliver(packet.direction, std::move(packet.datagram));
        }
        else
        {
            pending.push_back(std::move(packet));
        }
    }
    _state->inFlight = std::move(pending);
}

void LoopbackNetwork::setLatency(core::u32 latencyTicks) noexcept { _state->latency = latencyTicks; }

void LoopbackNetwork::setDropFilter(DropFilter filter) { _state->dropFilter = std::move(filter); }

core::u32 LoopbackNetwork::latency() const noexcept { return _state->latency; }

core::u32 LoopbackNetwork::inFlight() const noexcept
{
    return static_cast<core::u32>(_state->inFlight.size());
}

core::u64 LoopbackNetwork::dropped() const noexcept { return _state->dropped; }

} // namespace rift::net::transport
