/**
 * @file ITransport.hpp
 * @brief Byte-moving seam between the replication layer and the network.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_TRANSPORT_ITRANSPORT_HPP
    #define RIFT_NET_TRANSPORT_ITRANSPORT_HPP

#include <rift/net/PacketQueue.hpp>
#include <rift/core/Expected.hpp>
#include <rift/core/Types.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace rift::net::transport {

/**
 * @class IServerTransport
 * @brief Server endpoint.  Peers are identified by a transport-assigned
 *        ClientId that stays stable for the peer's lifetime.
 *
 * Implementations never block: sends are fire-and-forget, and receive()
 * only drains what has already arrived.
 */
class IServerTransport
{
public:
    virtual ~IServerTransport() = default;

    [[nodiscard]] virtual core::Expected<void> sendToClient(core::ClientId client,
                                                            std::span<const core::byte> bytes) = 0;

    /** @brief Sends @p bytes to every peer the transport knows. */
    virtual void broadcast(std::span<const core::byte> bytes) = 0;

    /** @brief Datagrams received since the last call, in arrival order. */
    [[nodiscard]] virtual std::vector<Datagram> receive() = 0;

    /** @brief Forgets @p client; later datagrams from it get a new id. */
    virtual void forget(core::ClientId client) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @class IClientTransport
 * @brief Client endpoint talking to a single server.
 */
class IClientTransport
{
public:
    virtual ~IClientTransport() = default;

    [[nodiscard]] virtual core::Expected<void> send(std::span<const core::byte> bytes) = 0;

    /** @brief Datagrams received since the last call, in arrival order. */
    [[nodiscard]] virtual std::vector<std::vector<core::byte>> receive() = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace rift::net::transport

#endif // RIFT_NET_TRANSPORT_ITRANSPORT_HPP
