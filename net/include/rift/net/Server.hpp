/**
 * @file Server.hpp
 * @brief Authoritative replication server.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_SERVER_HPP
    #define RIFT_NET_SERVER_HPP

#include <rift/net/replication/SnapshotHistory.hpp>
#include <rift/net/session/SessionManager.hpp>
#include <rift/net/transport/ITransport.hpp>
#include <rift/engine/World.hpp>
#include <rift/core/Expected.hpp>
#include <rift/core/NonCopyable.hpp>

#include <memory>

namespace rift::net {

/**
 * @class Server
 * @brief Drives an authoritative World from client inputs and streams
 *        snapshot deltas back.
 *
 * One tick():
 *  1. drains the transport (Connect, Input, SnapshotAck, Disconnect);
 *  2. reaps sessions idle longer than the client timeout;
 *  3. applies each session's next input, in sequence order;
 *  4. steps the world once;
 *  5. records the world snapshot and sends every client a single delta
 *     against its last acknowledged tick.
 *
 * A malformed packet is dropped; a client sending too many in a row is
 * disconnected.
 */
class Server final : public core::NonCopyable<Server>
{
public:
    Server(engine::World& world, transport::IServerTransport& transport);
    ~Server();

    /**
     * @brief Runs one server tick.
     * @return kTickOverrun when the simulation step exceeded its budget
     *         (the tick, including sends, still completed).
     */
    [[nodiscard]] core::Expected<void> tick();

    [[nodiscard]] engine::World& world() noexcept;
    [[nodiscard]] session::SessionManager&       sessions() noexcept;
    [[nodiscard]] const session::SessionManager& sessions() const noexcept;
    [[nodiscard]] const replication::SnapshotHistory& history() const noexcept;

    /** @brief Malformed packets dropped since start. */
    [[nodiscard]] core::u64 malformedDropped() const noexcept;

    /** @brief Snapshot packets sent since start. */
    [[nodiscard]] core::u64 snapshotsSent() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rift::net

#endif // RIFT_NET_SERVER_HPP
