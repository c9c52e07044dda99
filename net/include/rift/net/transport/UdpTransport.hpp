/**
 * @file UdpTransport.hpp
 * @brief POSIX UDP socket transports.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_TRANSPORT_UDPTRANSPORT_HPP
    #define RIFT_NET_TRANSPORT_UDPTRANSPORT_HPP

#include <rift/net/transport/ITransport.hpp>
#include <rift/core/NonCopyable.hpp>

#include <memory>
#include <string>

namespace rift::net::transport {

/**
 * @class UdpServerTransport
 * @brief Non-blocking UDP socket bound to a local port.
 *
 * A receiver thread waits on the socket and enqueues datagrams into a
 * PacketQueue; receive() drains it.  Each distinct remote address gets its
 * own ClientId.
 */
class UdpServerTransport final : public IServerTransport,
                                 public core::NonCopyable<UdpServerTransport>
{
public:
    explicit UdpServerTransport(core::u16 port);
    ~UdpServerTransport() override;

    /** @brief Creates and binds the socket and starts the receiver. */
    [[nodiscard]] core::Expected<void> open();
    void close();

    [[nodiscard]] core::Expected<void> sendToClient(core::ClientId client,
                                                    std::span<const core::byte> bytes) override;
    void broadcast(std::span<const core::byte> bytes) override;
    [[nodiscard]] std::vector<Datagram> receive() override;
    void forget(core::ClientId client) override;
    [[nodiscard]] std::string_view name() const noexcept override;

    /** @brief Port actually bound (differs from the requested one for port 0). */
    [[nodiscard]] core::u16 port() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/**
 * @class UdpClientTransport
 * @brief Non-blocking UDP socket connected to one server address.
 */
class UdpClientTransport final : public IClientTransport,
                                 public core::NonCopyable<UdpClientTransport>
{
public:
    UdpClientTransport(std::string host, core::u16 port);
    ~UdpClientTransport() override;

    /** @brief Resolves the host, connects the socket and starts the receiver. */
    [[nodiscard]] core::Expected<void> open();
    void close();

    [[nodiscard]] core::Expected<void> send(std::span<const core::byte> bytes) override;
    [[nodiscard]] std::vector<std::vector<core::byte>> receive() override;
    [[nodiscard]] std::string_view name() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rift::net::transport

#endif // RIFT_NET_TRANSPORT_UDPTRANSPORT_HPP
