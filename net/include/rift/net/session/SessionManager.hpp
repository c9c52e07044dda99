/**
 * @file SessionManager.hpp
 * @brief Manages all active client sessions on the server.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_SESSION_SESSIONMANAGER_HPP
    #define RIFT_NET_SESSION_SESSIONMANAGER_HPP

#include <rift/net/session/Session.hpp>
#include <rift/core/Expected.hpp>
#include <rift/core/NonCopyable.hpp>
#include <rift/core/Types.hpp>

#include <functional>
#include <memory>

namespace rift::net::session {

/**
 * @class SessionManager
 * @brief Active session registry with tick-based timeout disconnection.
 *
 * Sessions are visited in ClientId order so that per-tick processing is
 * deterministic.
 */
class SessionManager final : public core::NonCopyable<SessionManager>
{
public:
    explicit SessionManager(core::u32 maxSessions = core::kMaxSessions);
    ~SessionManager();

    /**
     * @brief Creates a new session for a connecting client.
     * @return The new session; kAlreadyExists if the client already has
     *         one, kOutOfRange when the server is full.
     */
    [[nodiscard]] core::Expected<Session*> connect(core::ClientId clientId, core::Tick tick);

    /**
     * @brief Disconnects a client session.
     * @return kNotFound if the client has no session.
     */
    [[nodiscard]] core::Expected<void> disconnect(core::ClientId clientId);

    [[nodiscard]] Session*       find(core::ClientId clientId) noexcept;
    [[nodiscard]] const Session* find(core::ClientId clientId) const noexcept;

    void forEach(const std::function<void(Session&)>& callback);

    /**
     * @brief Removes sessions idle for more than @p timeoutTicks.
     * @param onReaped Called with each session just before it is removed.
     * @return Number of sessions reaped.
     */
    core::u32 reapTimedOut(core::Tick currentTick, core::u32 timeoutTicks,
                           const std::function<void(Session&)>& onReaped);

    [[nodiscard]] bool contains(core::ClientId clientId) const noexcept;
    [[nodiscard]] core::u32 activeCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rift::net::session

#endif // RIFT_NET_SESSION_SESSIONMANAGER_HPP
