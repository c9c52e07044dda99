/**
 * @file Session.hpp
 * @brief Represents a single client session on the server.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_SESSION_SESSION_HPP
    #define RIFT_NET_SESSION_SESSION_HPP

#include <rift/net/protocol/Messages.hpp>
#include <rift/ecs/Entity.hpp>
#include <rift/core/Constants.hpp>
#include <rift/core/NonCopyable.hpp>
#include <rift/core/Types.hpp>

#include <deque>
#include <optional>

namespace rift::net::session {

/**
 * @enum SessionState
 * @brief Lifecycle states of a client session.
 */
enum class SessionState : core::u8
{
    Connecting,
    Connected,
    Disconnected
};

/**
 * @class Session
 * @brief Per-client state: entity binding, pending inputs, snapshot
 *        acknowledgement and liveness.
 *
 * Inputs are kept in sequence order.  An input whose sequence was already
 * applied or is already queued is dropped, so reordered or duplicated
 * datagrams never replay an action.
 */
class Session final : public core::NonCopyable<Session>
{
public:
    /**
     * @param clientId     Transport-assigned peer id.
     * @param currentTick  Tick the session is created on (initial activity).
     */
    Session(core::ClientId clientId, core::Tick currentTick);
    ~Session();

    [[nodiscard]] core::ClientId clientId() const noexcept;

    [[nodiscard]] SessionState state() const noexcept;
    void setState(SessionState newState) noexcept;

    /** @brief Binds the character this client controls. */
    void bindEntity(ecs::EntityId entity) noexcept;
    [[nodiscard]] ecs::EntityId boundEntity() const noexcept;

    // --------------------------------------------------------------------- //
    //  Inputs                                                                //
    // --------------------------------------------------------------------- //

    /**
     * @brief Queues an input in sequence order.
     * @return @c false if the input was stale, duplicated, or the queue was
     *         full (the newest input is then dropped).
     */
    bool pushInput(const protocol::InputCommand& command);

    /**
     * @brief Next input to apply this tick.
     *
     * When the queue is empty the last applied movement is repeated with no
     * action pressed, and the acknowledged sequence does not move.
     */
    [[nodiscard]] protocol::InputCommand nextInput();

    [[nodiscard]] core::usize pendingInputs() const noexcept;

    /** @brief Sequence of the last input applied by the server. */
    [[nodiscard]] core::Sequence lastAppliedSequence() const noexcept;

    // --------------------------------------------------------------------- //
    //  Snapshots                                                             //
    // --------------------------------------------------------------------- //

    /** @brief Records a client ack; older acks than the current one are ignored. */
    void acknowledgeSnapshot(core::Tick tick) noexcept;
    [[nodiscard]] core::Tick ackedTick() const noexcept;

    void markFullSnapshot(core::Tick tick) noexcept;
    [[nodiscard]] std::optional<core::Tick> lastFullSnapshot() const noexcept;

    // --------------------------------------------------------------------- //
    //  Health                                                                //
    // --------------------------------------------------------------------- //

    /** @brief Counts a malformed packet and returns the consecutive total. */
    core::u32 recordMalformed() noexcept;
    [[nodiscard]] core::u32 consecutiveMalformed() const noexcept;

    /** @brief Marks activity (a well-formed packet arrived). */
    void touch(core::Tick tick) noexcept;
    [[nodiscard]] core::Tick lastActivity() const noexcept;

private:
    core::ClientId                     _clientId;
    SessionState                       _state{SessionState::Connecting};
    ecs::EntityId                      _entity{};
    std::deque<protocol::InputCommand> _inputs;
    protocol::InputCommand             _lastInput{};
    core::Tick                         _ackedTick{0};
    std::optional<core::Tick>          _lastFullSnapshot;
    core::u32                          _malformed{0};
    core::Tick                         _lastActivity;
};

} // namespace rift::net::session

#endif // RIFT_NET_SESSION_SESSION_HPP
