/**
 * @file LoopbackNetwork.hpp
 * @brief In-process network with simulated latency and loss.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_TRANSPORT_LOOPBACKNETWORK_HPP
    #define RIFT_NET_TRANSPORT_LOOPBACKNETWORK_HPP

#include <rift/net/transport/ITransport.hpp>
#include <rift/core/NonCopyable.hpp>
#include <rift/core/Types.hpp>

#include <functional>
#include <memory>

namespace rift::net::transport {

struct LoopbackState;

/** @brief Direction of a packet crossing the loopback network. */
enum class LoopbackDirection : core::u8
{
    ToServer,
    ToClient
};

/**
 * @class LoopbackNetwork
 * @brief Connects one server endpoint and any number of client endpoints
 *        through in-memory queues.
 *
 * Time advances only through advance(): a packet sent at network tick t is
 * delivered once the network reaches t + latency.  With zero latency it is
 * delivered immediately.  A drop filter can discard packets on the way.
 * Endpoints share the network's state and stay valid after it is destroyed.
 */
class LoopbackNetwork final : public core::NonCopyable<LoopbackNetwork>
{
public:
    /** @brief Returns @c true to drop the packet. */
    using DropFilter = std::function<bool(LoopbackDirection, core::ClientId, std::span<const core::byte>)>;

    explicit LoopbackNetwork(core::u32 latencyTicks = 0);
    ~LoopbackNetwork();

    /** @brief The server endpoint (one per network). */
    [[nodiscard]] std::unique_ptr<IServerTransport> serverEndpoint();

    /** @brief A new client endpoint with the next ClientId. */
    [[nodiscard]] std::unique_ptr<IClientTransport> clientEndpoint();

    /** @brief Moves network time forward one tick, delivering due packets. */
    void advance();

    void setLatency(core::u32 latencyTicks) noexcept;
    void setDropFilter(DropFilter filter);

    [[nodiscard]] core::u32 latency() const noexcept;
    [[nodiscard]] core::u32 inFlight() const noexcept;
    [[nodiscard]] core::u64 dropped() const noexcept;

private:
    std::shared_ptr<LoopbackState> _state;
};

} // namespace rift::net::transport

#endif // RIFT_NET_TRANSPORT_LOOPBACKNETWORK_HPP
